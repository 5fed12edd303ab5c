//
// PNG chunk type code.
//

#include <algorithm>

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

namespace pngme {

    chunk_type chunk_type::parse(std::string_view text) {
        if (text.size() != 4) {
            throw chunk_type_error(chunk_type_error::kind::invalid_length,
                                   build_error_msg("Expected 4 bytes but received ", text.size(),
                                                   " when creating chunk type"),
                                   text.size());
        }

        bool letters = std::all_of(text.begin(), text.end(), [](char c) {
            return is_ascii_letter(static_cast<std::uint8_t>(c));
        });
        if (!letters) {
            throw chunk_type_error(chunk_type_error::kind::invalid_character,
                                   build_error_msg("Chunk type '", text,
                                                   "' contains one or more invalid characters"));
        }

        return from_bytes(text.data());
    }

}
