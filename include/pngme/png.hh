/**
 * @file png.hh
 * @brief PNG file as a signature followed by an ordered chunk sequence
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string_view>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class png
     * @brief Ordered collection of chunks making up a PNG file
     *
     * Chunk order is file order: it is kept on serialization and new
     * chunks go to the end. Several chunks may share a type; lookups by
     * type act on the first match.
     */
    class PNGME_EXPORT png {
    public:
        /// The 8 bytes every PNG file starts with
        static constexpr std::array<std::uint8_t, 8> signature{137, 80, 78, 71, 13, 10, 26, 10};

        png() = default;
        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Decode a whole PNG byte stream
         * @param data Signature followed by chunks
         * @param size Number of bytes in @p data
         * @param options Strictness, size limit and warning handler
         *
         * Throws png_error (invalid_signature) if the input does not start
         * with the signature. In strict mode any chunk_error propagates and
         * no container is produced. In lenient mode the failing chunk is
         * reported to options.on_warning and the chunks before it are kept.
         */
        static png parse(const std::uint8_t* data, std::size_t size, const parse_options& options = {});
        static png parse(const std::vector<std::uint8_t>& bytes, const parse_options& options = {});

        /// Signature followed by every chunk in order
        [[nodiscard]] std::vector<std::uint8_t> to_bytes() const;

        /// Add a chunk after the current last one
        void append_chunk(chunk c);

        /// Insert before position @p index; index == size() appends
        void insert_chunk(std::size_t index, chunk c);

        /// First chunk of the given type, nullptr if there is none
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        /// Every chunk of the given type, in file order
        [[nodiscard]] std::vector<const chunk*> chunks_by_type(std::string_view type) const;

        /**
         * @brief Remove and return the first chunk of the given type
         *
         * The remaining chunks keep their order. Throws png_error
         * (chunk_not_found) and leaves the sequence untouched if no
         * chunk matches.
         */
        chunk remove_chunk(std::string_view type);

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }
        [[nodiscard]] std::size_t size() const { return m_chunks.size(); }
        [[nodiscard]] bool empty() const { return m_chunks.empty(); }

        bool operator==(const png& o) const { return m_chunks == o.m_chunks; }
        bool operator!=(const png& o) const { return !(*this == o); }

    private:
        std::vector<chunk> m_chunks;
    };

} // namespace pngme
