//
// Bounds-checked cursor over an in-memory byte buffer.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include <pngme/exceptions.hh>
#include <pngme/chunk.hh>
#include <pngme/chunk_type.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    // Reads from a buffer it does not own. Every read checks the remaining
    // size first and throws parse_error instead of running off the end.
    class reader {
        public:
            reader(const std::uint8_t* data, std::size_t size);

            // Copies up to size bytes, returns the count actually copied
            std::size_t read(void* dst, std::size_t size);

            [[nodiscard]] std::uint64_t tell() const { return m_position; }
            [[nodiscard]] std::uint64_t size() const { return m_size; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
            [[nodiscard]] bool at_end() const { return m_position == m_size; }

            // Convenience methods, throw on short input
            std::vector<std::uint8_t> read_exact(std::size_t size);
            std::uint32_t read_u32be();
            chunk_type read_chunk_type();

        private:
            const std::uint8_t* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    /**
     * @brief Decode the chunk at the reader's position and advance past it
     *
     * Offsets in error messages are positions in the reader's buffer.
     */
    chunk read_chunk(reader& in, const parse_options& options);
}
