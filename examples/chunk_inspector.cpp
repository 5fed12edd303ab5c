/**
 * @file chunk_inspector.cpp
 * @brief List the chunks of a PNG file with their type properties
 *
 * Parses leniently, so a damaged file still shows every chunk before
 * the first broken one, followed by the warning that stopped parsing.
 */

#include <pngme/png.hh>
#include <pngme/io.hh>
#include <pngme/chunk_types.hh>
#include <pngme/exceptions.hh>
#include <iostream>
#include <fstream>
#include <iomanip>
#include <map>
#include <string>

namespace {
    const char* flag(bool set, const char* yes, const char* no) {
        return set ? yes : no;
    }
}

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <png_file>\n";
        std::cout << "\n";
        std::cout << "Lists every chunk with its size, CRC and type flags.\n";
        return 1;
    }

    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }

    pngme::parse_options options;
    options.strict = false;
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    try {
        auto image = pngme::read_png(file, options);

        std::cout << "File: " << argv[1] << "\n";
        std::cout << "====================\n\n";

        std::map<std::string, std::size_t> counts;
        std::uint64_t offset = pngme::png::signature.size();
        for (const auto& c : image.chunks()) {
            const auto& type = c.type();
            std::cout << std::setw(8) << offset << "  " << type
                      << "  " << std::setw(10) << c.length() << " bytes"
                      << "  crc " << std::hex << std::setw(8) << std::setfill('0') << c.crc()
                      << std::dec << std::setfill(' ')
                      << "  " << flag(type.is_critical(), "critical ", "ancillary")
                      << "  " << flag(type.is_public(), "public ", "private")
                      << "  " << flag(type.is_safe_to_copy(), "safe-to-copy", "unsafe-to-copy")
                      << "\n";
            counts[type.to_string()]++;
            offset += c.total_size();
        }

        std::cout << "\nSummary:\n";
        std::cout << "  Chunks: " << image.size() << "\n";
        for (const auto& [type, count] : counts) {
            std::cout << "  " << type << ": " << count << "\n";
        }

        if (!image.chunk_by_type(pngme::chunk_types::IHDR.to_string_view())) {
            std::cout << "  (no IHDR chunk)\n";
        }
    } catch (const pngme::pngme_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
