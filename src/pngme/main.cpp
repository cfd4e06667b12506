/**
 * @file main.cpp
 * @brief pngme - hide, read and remove text messages in PNG chunks
 *
 * Usage:
 *   pngme encode <file.png> <chunk_type> <message> [output.png]
 *   pngme decode <file.png> <chunk_type>
 *   pngme remove <file.png> <chunk_type> [output.png]
 *   pngme print  <file.png>
 */

#include <pngchunk/png.hh>
#include <pngchunk/file_io.hh>
#include <pngchunk/exceptions.hh>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

    void print_usage(const char* prog) {
        std::cout << "Usage: " << prog << " <command> [args]\n";
        std::cout << "\n";
        std::cout << "Commands:\n";
        std::cout << "  encode <file.png> <chunk_type> <message> [output.png]\n";
        std::cout << "      Append a chunk holding <message>. Writes output.png if given,\n";
        std::cout << "      otherwise prints the resulting file.\n";
        std::cout << "  decode <file.png> <chunk_type>\n";
        std::cout << "      Print the message stored in the first chunk of that type.\n";
        std::cout << "  remove <file.png> <chunk_type> [output.png]\n";
        std::cout << "      Remove the first chunk of that type and print it.\n";
        std::cout << "  print <file.png>\n";
        std::cout << "      Print every chunk in the file.\n";
    }

    pngchunk::parse_options make_options() {
        pngchunk::parse_options options;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
        };
        return options;
    }

    pngchunk::png load(const std::string& path) {
        return pngchunk::png::decode(pngchunk::read_file(path), make_options());
    }

    int cmd_encode(const std::vector<std::string>& args) {
        if (args.size() < 3 || args.size() > 4) {
            std::cerr << "encode expects <file.png> <chunk_type> <message> [output.png]\n";
            return 1;
        }

        auto type = pngchunk::chunk_type::from_string(args[1]);
        auto image = load(args[0]);
        image.append_chunk(pngchunk::chunk::from_text(type, args[2]));

        if (args.size() == 4) {
            pngchunk::write_file(args[3], image.as_bytes());
            std::cout << "Wrote " << args[3] << "\n";
        } else {
            std::cout << image;
        }
        return 0;
    }

    int cmd_decode(const std::vector<std::string>& args) {
        if (args.size() != 2) {
            std::cerr << "decode expects <file.png> <chunk_type>\n";
            return 1;
        }

        auto type = pngchunk::chunk_type::from_string(args[1]);
        auto image = load(args[0]);

        const auto* found = image.chunk_by_type(type.to_string());
        if (found) {
            std::cout << found->data_as_string() << "\n";
        } else {
            std::cout << "Chunk not found\n";
        }
        return 0;
    }

    int cmd_remove(const std::vector<std::string>& args) {
        if (args.size() < 2 || args.size() > 3) {
            std::cerr << "remove expects <file.png> <chunk_type> [output.png]\n";
            return 1;
        }

        auto type = pngchunk::chunk_type::from_string(args[1]);
        auto image = load(args[0]);

        auto removed = image.remove_chunk(type.to_string());
        std::cout << removed << "\n";

        if (args.size() == 3) {
            pngchunk::write_file(args[2], image.as_bytes());
            std::cout << "Wrote " << args[2] << "\n";
        }
        return 0;
    }

    int cmd_print(const std::vector<std::string>& args) {
        if (args.size() != 1) {
            std::cerr << "print expects <file.png>\n";
            return 1;
        }

        std::cout << load(args[0]);
        return 0;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (command == "encode") {
            return cmd_encode(args);
        }
        if (command == "decode") {
            return cmd_decode(args);
        }
        if (command == "remove") {
            return cmd_remove(args);
        }
        if (command == "print") {
            return cmd_print(args);
        }
        if (command == "-h" || command == "--help" || command == "help") {
            print_usage(argv[0]);
            return 0;
        }

        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
