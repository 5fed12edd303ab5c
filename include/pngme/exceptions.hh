/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 *
 * Every error raised by libpngme derives from pngme_error, so callers at
 * the application boundary can catch a single type. Concrete classes carry
 * a kind tag and the diagnostic values of the failure.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>

namespace pngme {

    /**
     * @class pngme_error
     * @brief Base exception class for all libpngme errors
     */
    class pngme_error : public std::runtime_error {
    public:
        explicit pngme_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for stream read/write failures
     */
    class io_error : public pngme_error {
    public:
        explicit io_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Base class for format errors found while decoding bytes or text
     */
    class parse_error : public pngme_error {
    public:
        explicit parse_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class chunk_type_error
     * @brief A chunk type string could not be turned into a chunk type
     */
    class chunk_type_error : public parse_error {
    public:
        enum class kind {
            invalid_length,     ///< Text is not exactly 4 bytes long
            invalid_character   ///< Text contains a byte that is not an ASCII letter
        };

        chunk_type_error(kind k, const std::string& msg, std::size_t length = 4)
            : parse_error(msg), m_kind(k), m_length(length) {}

        [[nodiscard]] kind error_kind() const noexcept { return m_kind; }

        /// Byte length of the rejected text
        [[nodiscard]] std::size_t length() const noexcept { return m_length; }

    private:
        kind m_kind;
        std::size_t m_length;
    };

    /**
     * @class chunk_error
     * @brief A chunk could not be decoded, or its payload could not be read as text
     */
    class chunk_error : public parse_error {
    public:
        enum class kind {
            too_small,          ///< Fewer than 12 bytes available
            invalid_chunk_type, ///< Type bytes fail the letter or reserved-bit rule
            truncated,          ///< Declared length runs past the end of the input
            size_limit,         ///< Length exceeds the configured maximum
            invalid_crc,        ///< Stored CRC differs from the computed one
            invalid_utf8        ///< Payload is not well-formed UTF-8
        };

        chunk_error(kind k, const std::string& msg)
            : parse_error(msg), m_kind(k) {}

        [[nodiscard]] kind error_kind() const noexcept { return m_kind; }

        /// Short machine-readable name of the kind, used as warning category
        [[nodiscard]] const char* category() const noexcept {
            switch (m_kind) {
                case kind::too_small:
                    return "too_small";
                case kind::invalid_chunk_type:
                    return "invalid_chunk_type";
                case kind::truncated:
                    return "truncated";
                case kind::size_limit:
                    return "size_limit";
                case kind::invalid_crc:
                    return "invalid_crc";
                case kind::invalid_utf8:
                    return "invalid_utf8";
            }
            return "unknown";
        }

        /// CRC stored in the input (invalid_crc only)
        [[nodiscard]] std::uint32_t expected() const noexcept { return m_expected; }

        /// CRC computed over type and payload (invalid_crc only)
        [[nodiscard]] std::uint32_t actual() const noexcept { return m_actual; }

        /// Length field of the chunk (truncated, size_limit)
        [[nodiscard]] std::uint64_t declared() const noexcept { return m_declared; }

        /// Bytes left for payload and CRC (truncated only)
        [[nodiscard]] std::uint64_t available() const noexcept { return m_available; }

        static chunk_error crc_mismatch(const std::string& msg, std::uint32_t expected, std::uint32_t actual) {
            chunk_error e(kind::invalid_crc, msg);
            e.m_expected = expected;
            e.m_actual = actual;
            return e;
        }

        static chunk_error sized(kind k, const std::string& msg, std::uint64_t declared, std::uint64_t available = 0) {
            chunk_error e(k, msg);
            e.m_declared = declared;
            e.m_available = available;
            return e;
        }

    private:
        kind m_kind;
        std::uint32_t m_expected = 0;
        std::uint32_t m_actual = 0;
        std::uint64_t m_declared = 0;
        std::uint64_t m_available = 0;
    };

    /**
     * @class png_error
     * @brief Container-level failures: bad signature or missing chunk
     */
    class png_error : public pngme_error {
    public:
        enum class kind {
            invalid_signature,  ///< Input does not start with the PNG signature
            chunk_not_found,    ///< No chunk of the requested type
            index_out_of_range  ///< Insert position past the end of the sequence
        };

        png_error(kind k, const std::string& msg)
            : pngme_error(msg), m_kind(k) {}

        [[nodiscard]] kind error_kind() const noexcept { return m_kind; }

    private:
        kind m_kind;
    };

    /**
     * @brief Build error message from variadic arguments
     *
     * Uses C++17 fold expressions to concatenate all arguments into
     * a single error message string.
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /// Throw an io_error with formatted message
    #define PNGME_THROW_IO(...) \
        throw ::pngme::io_error(::pngme::build_error_msg(__VA_ARGS__))

    /// Throw a parse_error with formatted message
    #define PNGME_THROW_PARSE(...) \
        throw ::pngme::parse_error(::pngme::build_error_msg(__VA_ARGS__))

    /// Throw a chunk_error of the given kind with formatted message
    #define PNGME_THROW_CHUNK(k, ...) \
        throw ::pngme::chunk_error(::pngme::chunk_error::kind::k, ::pngme::build_error_msg(__VA_ARGS__))

    /// Throw a png_error of the given kind with formatted message
    #define PNGME_THROW_PNG(k, ...) \
        throw ::pngme::png_error(::pngme::png_error::kind::k, ::pngme::build_error_msg(__VA_ARGS__))

    /// Conditionally throw an io_error
    #define PNGME_THROW_IO_IF(condition, ...) \
        do { if (condition) PNGME_THROW_IO(__VA_ARGS__); } while(0)

    /// Conditionally throw a parse_error
    #define PNGME_THROW_PARSE_IF(condition, ...) \
        do { if (condition) PNGME_THROW_PARSE(__VA_ARGS__); } while(0)

    /// Throw an io_error unless condition is true
    #define PNGME_THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) PNGME_THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
