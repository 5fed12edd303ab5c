//
// PNG chunk decoding and encoding.
//

#include <algorithm>
#include <ostream>
#include <utility>

#include <pngme/chunk.hh>
#include <pngme/endian.hh>
#include <pngme/exceptions.hh>
#include "crc.hh"
#include "input.hh"

namespace pngme {

    namespace {
        constexpr std::uint32_t max_length = 0x7FFFFFFFu;

        // Well-formed UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF
        bool is_valid_utf8(const std::uint8_t* s, std::size_t n) {
            std::size_t i = 0;
            while (i < n) {
                std::uint8_t c = s[i];
                if (c < 0x80) {
                    i++;
                    continue;
                }

                std::size_t extra;
                std::uint8_t lo = 0x80;
                std::uint8_t hi = 0xBF;
                if (c >= 0xC2 && c <= 0xDF) {
                    extra = 1;
                } else if (c == 0xE0) {
                    extra = 2;
                    lo = 0xA0;
                } else if (c == 0xED) {
                    extra = 2;
                    hi = 0x9F;
                } else if (c >= 0xE1 && c <= 0xEF) {
                    extra = 2;
                } else if (c == 0xF0) {
                    extra = 3;
                    lo = 0x90;
                } else if (c == 0xF4) {
                    extra = 3;
                    hi = 0x8F;
                } else if (c >= 0xF1 && c <= 0xF3) {
                    extra = 3;
                } else {
                    return false;
                }

                if (n - i <= extra) {
                    return false;
                }
                // Only the first continuation byte has a narrowed range
                if (s[i + 1] < lo || s[i + 1] > hi) {
                    return false;
                }
                for (std::size_t k = 2; k <= extra; ++k) {
                    if ((s[i + k] & 0xC0) != 0x80) {
                        return false;
                    }
                }
                i += extra + 1;
            }
            return true;
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::uint8_t> data)
        : m_length(0), m_type(type), m_data(std::move(data)), m_crc(0) {
        if (m_data.size() > max_length) {
            throw chunk_error::sized(chunk_error::kind::size_limit,
                                     build_error_msg("Chunk '", m_type, "' payload of ", m_data.size(),
                                                     " bytes exceeds the PNG limit of ", max_length, " bytes"),
                                     m_data.size());
        }
        m_length = static_cast<std::uint32_t>(m_data.size());
        m_crc = chunk_crc(m_type, m_data.data(), m_data.size());
    }

    chunk::chunk(std::uint32_t length, chunk_type type, std::vector<std::uint8_t> data, std::uint32_t crc)
        : m_length(length), m_type(type), m_data(std::move(data)), m_crc(crc) {}

    chunk chunk::from_string(chunk_type type, std::string_view text) {
        return chunk(type, std::vector<std::uint8_t>(text.begin(), text.end()));
    }

    chunk chunk::parse(const std::uint8_t* data, std::size_t size, const parse_options& options) {
        reader in(data, size);
        return read_chunk(in, options);
    }

    chunk chunk::parse(const std::vector<std::uint8_t>& bytes, const parse_options& options) {
        return parse(bytes.data(), bytes.size(), options);
    }

    chunk read_chunk(reader& in, const parse_options& options) {
        const std::uint64_t start = in.tell();

        if (in.remaining() < chunk::overhead) {
            PNGME_THROW_CHUNK(too_small, "At least ", chunk::overhead, " bytes must be supplied to construct a chunk, ",
                              in.remaining(), " available at offset ", start);
        }

        std::uint32_t length = in.read_u32be();
        chunk_type type = in.read_chunk_type();

        if (!type.is_valid()) {
            PNGME_THROW_CHUNK(invalid_chunk_type, "Invalid chunk type ", type, " at offset ", start);
        }

        if (length > options.max_chunk_size) {
            throw chunk_error::sized(chunk_error::kind::size_limit,
                                     build_error_msg("Chunk '", type, "' at offset ", start, " has length ", length,
                                                     " bytes, which exceeds maximum allowed size of ",
                                                     options.max_chunk_size, " bytes"),
                                     length);
        }

        // Payload and CRC must both fit in what is left
        std::uint64_t needed = std::uint64_t(length) + 4;
        if (needed > in.remaining()) {
            throw chunk_error::sized(chunk_error::kind::truncated,
                                     build_error_msg("Chunk '", type, "' at offset ", start, " declares ", length,
                                                     " bytes of data but only ", in.remaining(),
                                                     " bytes remain for data and CRC"),
                                     length, in.remaining());
        }

        std::vector<std::uint8_t> data = in.read_exact(length);
        std::uint32_t stored = in.read_u32be();
        std::uint32_t computed = chunk_crc(type, data.data(), data.size());

        if (stored != computed) {
            throw chunk_error::crc_mismatch(
                build_error_msg("Invalid CRC for chunk '", type, "' at offset ", start,
                                ". Expected ", stored, " but found ", computed),
                stored, computed);
        }

        return chunk(length, type, std::move(data), stored);
    }

    std::string chunk::data_as_string() const {
        if (!is_valid_utf8(m_data.data(), m_data.size())) {
            PNGME_THROW_CHUNK(invalid_utf8, "Data of chunk '", m_type, "' is not valid UTF-8");
        }
        return {m_data.begin(), m_data.end()};
    }

    void chunk::write_to(std::vector<std::uint8_t>& out) const {
        std::size_t pos = out.size();
        out.resize(pos + total_size());

        std::uint8_t* dst = out.data() + pos;
        store_be32(dst, m_length);
        m_type.to_bytes(dst + 4);
        std::copy(m_data.begin(), m_data.end(), dst + 8);
        store_be32(dst + 8 + m_data.size(), m_crc);
    }

    std::vector<std::uint8_t> chunk::to_bytes() const {
        std::vector<std::uint8_t> out;
        out.reserve(total_size());
        write_to(out);
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << "length: " << c.length() << ", chunk type: " << c.type() << ", data: [";
        const auto& data = c.data();
        for (std::size_t i = 0; i < data.size(); ++i) {
            if (i > 0) {
                os << ", ";
            }
            os << static_cast<unsigned>(data[i]);
        }
        os << "], crc: " << c.crc();
        return os;
    }

}
