//
// Bounds-checked cursor over an in-memory byte buffer.
//

#include <algorithm>

#include <pngme/endian.hh>
#include "input.hh"

namespace pngme {
    reader::reader(const std::uint8_t* data, std::size_t size)
        : m_data(data), m_size(size), m_position(0) {
        PNGME_THROW_PARSE_IF(!data && size > 0, "Null buffer of size ", size, " given to reader");
    }

    std::size_t reader::read(void* dst, std::size_t size) {
        PNGME_THROW_PARSE_IF(!dst && size > 0, "Null buffer in read");

        size = std::min(size, remaining());
        if (size == 0) {
            return 0;
        }

        std::copy_n(m_data + m_position, size, static_cast<std::uint8_t*>(dst));
        m_position += size;
        return size;
    }

    std::vector<std::uint8_t> reader::read_exact(std::size_t size) {
        PNGME_THROW_PARSE_IF(size > remaining(), "Unexpected end of data at offset ", m_position,
                             ": requested ", size, " bytes, ", remaining(), " available");
        std::vector<std::uint8_t> buffer(m_data + m_position, m_data + m_position + size);
        m_position += size;
        return buffer;
    }

    std::uint32_t reader::read_u32be() {
        PNGME_THROW_PARSE_IF(remaining() < 4, "Failed to read 4 bytes at offset ", m_position);
        std::uint32_t value = load_be32(m_data + m_position);
        m_position += 4;
        return value;
    }

    chunk_type reader::read_chunk_type() {
        PNGME_THROW_PARSE_IF(remaining() < 4, "Failed to read chunk type at offset ", m_position);
        auto type = chunk_type::from_bytes(m_data + m_position);
        m_position += 4;
        return type;
    }
}
