//
// CRC-32 (ISO-HDLC / IEEE 802.3) as used by PNG chunks.
//

#include <algorithm>
#include <limits>

#include <zlib.h>

#include "crc.hh"

namespace pngme {

    std::uint32_t chunk_crc(const chunk_type& type, const std::uint8_t* data, std::size_t size) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, type.bytes().data(), 4);

        // zlib takes uInt lengths; feed large payloads in pieces
        while (size > 0) {
            auto piece = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            crc = crc32(crc, data, piece);
            data += piece;
            size -= piece;
        }
        return static_cast<std::uint32_t>(crc);
    }

}
