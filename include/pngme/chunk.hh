/**
 * @file chunk.hh
 * @brief A single PNG chunk: length, type, payload and CRC
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    class reader;

    /**
     * @class chunk
     * @brief One checksummed chunk of a PNG stream
     *
     * A chunk is immutable once built. Its CRC always matches its type and
     * payload: it is computed on construction and verified on parse.
     */
    class PNGME_EXPORT chunk {
    public:
        /// Bytes of framing around the payload: length, type and CRC fields
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Build a chunk from a type and payload
         *
         * The type is not validated here; call chunk_type::is_valid() when
         * that matters. Throws chunk_error (size_limit) if the payload is
         * longer than a PNG length field allows.
         */
        chunk(chunk_type type, std::vector<std::uint8_t> data);

        /// Build a chunk whose payload is the bytes of @p text
        static chunk from_string(chunk_type type, std::string_view text);

        /**
         * @brief Decode one chunk from the start of a buffer
         * @param data Buffer holding length, type, payload and CRC
         * @param size Number of bytes available in @p data
         * @param options Size limit applied to the length field
         *
         * Bytes after the CRC are ignored. Throws chunk_error on short input,
         * an invalid type, a length past the end of the buffer or a CRC
         * mismatch.
         */
        static chunk parse(const std::uint8_t* data, std::size_t size, const parse_options& options = {});
        static chunk parse(const std::vector<std::uint8_t>& bytes, const parse_options& options = {});

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::uint8_t>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /// Serialized size: payload plus 12 bytes of framing
        [[nodiscard]] std::size_t total_size() const { return overhead + m_data.size(); }

        /// Payload decoded as UTF-8 text; throws chunk_error (invalid_utf8)
        [[nodiscard]] std::string data_as_string() const;

        /// length ++ type ++ payload ++ crc, big-endian
        [[nodiscard]] std::vector<std::uint8_t> to_bytes() const;

        /// Append the serialized chunk to @p out
        void write_to(std::vector<std::uint8_t>& out) const;

        bool operator==(const chunk& o) const {
            return m_length == o.m_length && m_type == o.m_type &&
                   m_crc == o.m_crc && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(std::uint32_t length, chunk_type type, std::vector<std::uint8_t> data, std::uint32_t crc);

        friend chunk read_chunk(reader& in, const parse_options& options);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::uint8_t> m_data;
        std::uint32_t m_crc;
    };

    // Human readable form: "length: N, chunk type: T, data: [..], crc: C"
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngme
