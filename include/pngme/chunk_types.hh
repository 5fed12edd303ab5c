//
// Chunk types defined by the PNG specification.
//

#pragma once

#include <pngme/chunk_type.hh>

namespace pngme::chunk_types {

    // Critical chunks
    inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
    inline constexpr chunk_type IDAT('I', 'D', 'A', 'T');
    inline constexpr chunk_type IEND('I', 'E', 'N', 'D');

    // Ancillary chunks
    inline constexpr chunk_type tEXt('t', 'E', 'X', 't');
    inline constexpr chunk_type gAMA('g', 'A', 'M', 'A');

} // namespace pngme::chunk_types
