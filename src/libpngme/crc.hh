//
// CRC-32 (ISO-HDLC / IEEE 802.3) as used by PNG chunks.
//

#pragma once

#include <cstdint>
#include <cstddef>

#include <pngme/chunk_type.hh>

namespace pngme {

    // CRC over the type bytes followed by the payload
    std::uint32_t chunk_crc(const chunk_type& type, const std::uint8_t* data, std::size_t size);

}
