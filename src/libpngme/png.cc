//
// PNG container: signature check and chunk sequence management.
//

#include <algorithm>
#include <utility>

#include <pngme/png.hh>
#include <pngme/exceptions.hh>
#include "input.hh"

namespace pngme {

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {}

    png png::parse(const std::uint8_t* data, std::size_t size, const parse_options& options) {
        reader in(data, size);

        std::array<std::uint8_t, 8> header{};
        if (in.read(header.data(), header.size()) != header.size() || header != signature) {
            PNGME_THROW_PNG(invalid_signature, "Invalid PNG signature");
        }

        png result;
        while (!in.at_end()) {
            const std::uint64_t offset = in.tell();
            try {
                result.m_chunks.push_back(read_chunk(in, options));
            } catch (const chunk_error& e) {
                if (options.strict) {
                    throw;
                }
                if (options.on_warning) {
                    options.on_warning(offset, e.category(),
                        build_error_msg(e.what(), ", ignoring ", size - offset, " trailing bytes"));
                }
                break;
            }
        }

        return result;
    }

    png png::parse(const std::vector<std::uint8_t>& bytes, const parse_options& options) {
        return parse(bytes.data(), bytes.size(), options);
    }

    std::vector<std::uint8_t> png::to_bytes() const {
        std::size_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += c.total_size();
        }

        std::vector<std::uint8_t> out;
        out.reserve(total);
        out.insert(out.end(), signature.begin(), signature.end());
        for (const auto& c : m_chunks) {
            c.write_to(out);
        }
        return out;
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    void png::insert_chunk(std::size_t index, chunk c) {
        if (index > m_chunks.size()) {
            PNGME_THROW_PNG(index_out_of_range, "Cannot insert chunk '", c.type(), "' at position ", index,
                            ", the file has only ", m_chunks.size(), " chunks");
        }
        m_chunks.insert(m_chunks.begin() + static_cast<std::ptrdiff_t>(index), std::move(c));
    }

    const chunk* png::chunk_by_type(std::string_view type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type() == type;
        });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    std::vector<const chunk*> png::chunks_by_type(std::string_view type) const {
        std::vector<const chunk*> result;
        for (const auto& c : m_chunks) {
            if (c.type() == type) {
                result.push_back(&c);
            }
        }
        return result;
    }

    chunk png::remove_chunk(std::string_view type) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type() == type;
        });
        if (it == m_chunks.end()) {
            PNGME_THROW_PNG(chunk_not_found, "Could not find chunk '", type, "'");
        }

        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

} // namespace pngme
