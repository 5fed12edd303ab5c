/**
 * @file parse_options.hh
 * @brief Parsing options for PNG chunk streams
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngme {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing chunks and PNG files
     *
     * Controls strictness, the chunk size limit and warning handling.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, any damaged chunk fails the whole parse.
         * When false, png::parse reports the damaged chunk through
         * on_warning and keeps the chunks read before it.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk length in bytes
         *
         * Default is 2^31 - 1, the largest length a PNG chunk may declare.
         */
        std::uint32_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @typedef warning_handler
         * @param offset Byte offset of the chunk the warning is about
         * @param category Warning category (e.g., "invalid_crc", "truncated")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are dropped.
         */
        warning_handler on_warning;
    };

} // namespace pngme
