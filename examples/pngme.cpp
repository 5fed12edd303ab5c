/**
 * @file pngme.cpp
 * @brief Hide, show and remove text messages in PNG chunks
 *
 * Subcommands:
 *   encode <file> <chunk_type> <message> [output_file]
 *   decode <file> <chunk_type>
 *   remove <file> <chunk_type>
 *   print  <file>
 */

#include <pngme/png.hh>
#include <pngme/io.hh>
#include <pngme/exceptions.hh>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>

namespace {

    void usage(const char* prog) {
        std::cout << "Usage: " << prog << " <command> [args]\n";
        std::cout << "\n";
        std::cout << "Commands:\n";
        std::cout << "  encode <file> <chunk_type> <message> [output_file]\n";
        std::cout << "    Add a secret message to a PNG file\n";
        std::cout << "  decode <file> <chunk_type>\n";
        std::cout << "    Show a secret message from a PNG file\n";
        std::cout << "  remove <file> <chunk_type>\n";
        std::cout << "    Remove a secret message from a PNG file\n";
        std::cout << "  print <file>\n";
        std::cout << "    Print every chunk of a PNG file\n";
    }

    pngme::png load(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        PNGME_THROW_IO_UNLESS(file, "Cannot open file '", path, "'");
        return pngme::read_png(file);
    }

    void save(const std::string& path, const pngme::png& image) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        PNGME_THROW_IO_UNLESS(file, "Cannot open file '", path, "' for writing");
        pngme::write_png(file, image);
    }

    int encode_message(const std::vector<std::string>& args) {
        const auto& path = args[0];
        auto type = pngme::chunk_type::parse(args[1]);

        auto image = load(path);
        image.append_chunk(pngme::chunk::from_string(type, args[2]));

        save(args.size() == 4 ? args[3] : path, image);
        return 0;
    }

    int decode_message(const std::vector<std::string>& args) {
        auto type = pngme::chunk_type::parse(args[1]);
        auto image = load(args[0]);

        const auto* found = image.chunk_by_type(type.to_string_view());
        if (!found) {
            std::cerr << "Error: Could not find chunk '" << type << "'\n";
            return 1;
        }

        std::cout << *found << "\n";
        std::cout << "Message: " << found->data_as_string() << "\n";
        return 0;
    }

    int remove_message(const std::vector<std::string>& args) {
        const auto& path = args[0];
        auto type = pngme::chunk_type::parse(args[1]);

        auto image = load(path);
        auto removed = image.remove_chunk(type.to_string_view());
        save(path, image);

        std::cout << "Removed chunk: " << removed << "\n";
        return 0;
    }

    int print_chunks(const std::vector<std::string>& args) {
        auto image = load(args[0]);
        for (const auto& c : image.chunks()) {
            std::cout << c << "\n";
        }
        return 0;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (command == "encode" && (args.size() == 3 || args.size() == 4)) {
            return encode_message(args);
        } else if (command == "decode" && args.size() == 2) {
            return decode_message(args);
        } else if (command == "remove" && args.size() == 2) {
            return remove_message(args);
        } else if (command == "print" && args.size() == 1) {
            return print_chunks(args);
        }
    } catch (const pngme::pngme_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    usage(argv[0]);
    return 1;
}
