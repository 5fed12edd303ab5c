//
// Stream adapters for reading and writing PNG files.
//

#include <array>
#include <istream>
#include <ostream>

#include <pngme/io.hh>
#include <pngme/exceptions.hh>

namespace pngme {

    png read_png(std::istream& stream, const parse_options& options) {
        PNGME_THROW_IO_UNLESS(stream.good(), "Stream in bad state");

        std::vector<std::uint8_t> bytes;
        std::array<char, 4096> buffer{};
        while (stream) {
            stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto got = static_cast<std::size_t>(stream.gcount());
            bytes.insert(bytes.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(got));
        }

        PNGME_THROW_IO_IF(stream.bad(), "Stream read failed after ", bytes.size(), " bytes");
        return png::parse(bytes, options);
    }

    void write_png(std::ostream& stream, const png& file) {
        PNGME_THROW_IO_UNLESS(stream.good(), "Stream in bad state");

        auto bytes = file.to_bytes();
        stream.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        stream.flush();

        PNGME_THROW_IO_UNLESS(stream.good(), "Stream write failed for ", bytes.size(), " bytes");
    }

} // namespace pngme
