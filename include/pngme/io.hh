/**
 * @file io.hh
 * @brief Stream adapters for reading and writing PNG files
 */

#pragma once

#include <iosfwd>

#include <pngme/export_pngme.h>
#include <pngme/png.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @brief Read a stream to its end and parse it as a PNG file
     *
     * Throws io_error if the stream cannot be read, and whatever
     * png::parse throws for malformed content.
     */
    PNGME_EXPORT png read_png(std::istream& stream, const parse_options& options = {});

    /**
     * @brief Write the serialized PNG file to a stream
     *
     * Throws io_error if the stream rejects the write.
     */
    PNGME_EXPORT void write_png(std::ostream& stream, const png& file);

} // namespace pngme
