/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngchunk library
 * @author Igor
 * @date 02/09/2025
 *
 * Every failure the library can report is one of a closed set of kinds
 * (see error_kind). Each kind has its own exception class deriving from
 * pngchunk_error, so callers can either catch a specific condition or
 * catch pngchunk_error and switch on kind().
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <ostream>

namespace pngchunk {

    /**
     * @enum error_kind
     * @brief Identity of a library failure
     */
    enum class error_kind {
        io,                 ///< File could not be opened, read or written
        invalid_length,     ///< Buffer too short or declared length out of bounds
        invalid_chunk_type, ///< Chunk type bytes fail letter validation
        invalid_crc,        ///< Stored CRC does not match the computed one
        chunk_not_found,    ///< No chunk of the requested type exists
        encoding_error,     ///< Payload is not valid UTF-8 text
        signature_mismatch  ///< Container does not start with the PNG signature
    };

    /**
     * @brief Human readable name of an error kind
     */
    inline const char* to_string(error_kind kind) {
        switch (kind) {
            case error_kind::io:
                return "io";
            case error_kind::invalid_length:
                return "invalid_length";
            case error_kind::invalid_chunk_type:
                return "invalid_chunk_type";
            case error_kind::invalid_crc:
                return "invalid_crc";
            case error_kind::chunk_not_found:
                return "chunk_not_found";
            case error_kind::encoding_error:
                return "encoding_error";
            case error_kind::signature_mismatch:
                return "signature_mismatch";
        }
        return "unknown";
    }

    inline std::ostream& operator<<(std::ostream& os, error_kind kind) {
        return os << to_string(kind);
    }

    /**
     * @class pngchunk_error
     * @brief Base exception class for all pngchunk errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every library error with a single catch block.
     */
    class pngchunk_error : public std::runtime_error {
    public:
        pngchunk_error(error_kind kind, const std::string& msg)
            : std::runtime_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @class io_error
     * @brief Thrown when file access, reading or writing fails
     */
    class io_error : public pngchunk_error {
    public:
        explicit io_error(const std::string& msg)
            : pngchunk_error(error_kind::io, msg) {}
    };

    /**
     * @class invalid_length
     * @brief Thrown when a buffer is too short or a declared length is out of bounds
     */
    class invalid_length : public pngchunk_error {
    public:
        explicit invalid_length(const std::string& msg)
            : pngchunk_error(error_kind::invalid_length, msg) {}
    };

    /**
     * @class invalid_chunk_type
     * @brief Thrown when chunk type bytes are not four ASCII letters
     */
    class invalid_chunk_type : public pngchunk_error {
    public:
        explicit invalid_chunk_type(const std::string& msg)
            : pngchunk_error(error_kind::invalid_chunk_type, msg) {}
    };

    /**
     * @class invalid_crc
     * @brief Thrown when a chunk's stored checksum does not match its contents
     */
    class invalid_crc : public pngchunk_error {
    public:
        explicit invalid_crc(const std::string& msg)
            : pngchunk_error(error_kind::invalid_crc, msg) {}
    };

    /**
     * @class chunk_not_found
     * @brief Thrown when removing a chunk type that is not present
     */
    class chunk_not_found : public pngchunk_error {
    public:
        explicit chunk_not_found(const std::string& msg)
            : pngchunk_error(error_kind::chunk_not_found, msg) {}
    };

    /**
     * @class encoding_error
     * @brief Thrown when chunk data is requested as text but is not valid UTF-8
     */
    class encoding_error : public pngchunk_error {
    public:
        explicit encoding_error(const std::string& msg)
            : pngchunk_error(error_kind::encoding_error, msg) {}
    };

    /**
     * @class signature_mismatch
     * @brief Thrown when a buffer does not start with the PNG signature
     */
    class signature_mismatch : public pngchunk_error {
    public:
        explicit signature_mismatch(const std::string& msg)
            : pngchunk_error(error_kind::signature_mismatch, msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def PNGCHUNK_THROW
     * @brief Throw the given exception type with a formatted message
     * @param type Exception class (e.g. invalid_crc)
     * @param ... Variable arguments to format into error message
     */
    #define PNGCHUNK_THROW(type, ...) \
        throw ::pngchunk::type(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def PNGCHUNK_THROW_IF
     * @brief Conditionally throw the given exception type
     */
    #define PNGCHUNK_THROW_IF(condition, type, ...) \
        do { if (condition) PNGCHUNK_THROW(type, __VA_ARGS__); } while(0)

    /**
     * @def PNGCHUNK_THROW_UNLESS
     * @brief Throw the given exception type unless condition is true
     */
    #define PNGCHUNK_THROW_UNLESS(condition, type, ...) \
        do { if (!(condition)) PNGCHUNK_THROW(type, __VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) PNGCHUNK_THROW_IF(condition, io_error, __VA_ARGS__)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
