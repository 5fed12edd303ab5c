//
// PNG chunk type code: four bytes whose bit 5 carries the chunk's properties.
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>

#include <pngme/export_pngme.h>

namespace pngme {
    class PNGME_EXPORT chunk_type {
    public:
        // Default constructor - creates "    " (four spaces), which is not a valid type
        constexpr chunk_type() = default;

        // Constructor from 4 individual chars, no validation
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : b{ static_cast<std::uint8_t>(c0), static_cast<std::uint8_t>(c1),
                 static_cast<std::uint8_t>(c2), static_cast<std::uint8_t>(c3) } {}

        // Constructor from raw bytes, no validation
        explicit constexpr chunk_type(const std::array<std::uint8_t, 4>& bytes)
            : b(bytes) {}

        static chunk_type from_bytes(const void* data) {
            chunk_type result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        /**
         * Parse a 4-character type name such as "IHDR" or "RuSt".
         * Throws chunk_type_error if the text is not 4 bytes long or
         * contains anything but ASCII letters.
         */
        static chunk_type parse(std::string_view text);

        [[nodiscard]] static constexpr bool is_ascii_letter(std::uint8_t c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        // All bytes are ASCII letters and the reserved bit is clear
        [[nodiscard]] constexpr bool is_valid() const {
            return is_ascii_letter(b[0]) && is_ascii_letter(b[1]) &&
                   is_ascii_letter(b[2]) && is_ascii_letter(b[3]) &&
                   is_reserved_bit_valid();
        }

        // Ancillary bit (byte 0) clear
        [[nodiscard]] constexpr bool is_critical() const { return (b[0] & 32) == 0; }

        // Private bit (byte 1) clear
        [[nodiscard]] constexpr bool is_public() const { return (b[1] & 32) == 0; }

        // Reserved bit (byte 2) must be clear in PNG 1.2
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return (b[2] & 32) == 0; }

        // Safe-to-copy bit (byte 3) set
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return (b[3] & 32) != 0; }

        [[nodiscard]] constexpr const std::array<std::uint8_t, 4>& bytes() const { return b; }

        // Convert to string
        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(b.data()), 4};
        }

        // Convert to string_view
        [[nodiscard]] std::string_view to_string_view() const {
            return {reinterpret_cast<const char*>(b.data()), 4};
        }

        // Big-endian value, the way the type appears on the wire
        [[nodiscard]] constexpr std::uint32_t to_uint32() const {
            return (std::uint32_t(b[0]) << 24) | (std::uint32_t(b[1]) << 16) |
                   (std::uint32_t(b[2]) << 8) | std::uint32_t(b[3]);
        }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        constexpr std::uint8_t operator[](std::size_t i) const { return b[i]; }

        [[nodiscard]] constexpr auto begin() const { return b.begin(); }
        [[nodiscard]] constexpr auto end() const { return b.end(); }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return b == o.b; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return b < o.b; }

        // Compare against a type name
        bool operator==(std::string_view name) const { return to_string_view() == name; }
        bool operator!=(std::string_view name) const { return !(*this == name); }

        // Stream output
        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            if (os.flags() & std::ios::hex) {
                auto flags = os.flags();
                auto fill = os.fill();
                os << "0x" << std::hex << std::setfill('0') << std::setw(8)
                   << t.to_uint32();
                os.flags(flags);
                os.fill(fill);
            } else {
                for (std::uint8_t c : t.b) {
                    if (c >= 32 && c <= 126) {
                        os << static_cast<char>(c);
                    } else {
                        // Escape non-printable bytes
                        auto flags = os.flags();
                        auto fill = os.fill();
                        os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                           << static_cast<unsigned>(c);
                        os.flags(flags);
                        os.fill(fill);
                    }
                }
            }
            return os;
        }

    private:
        std::array<std::uint8_t, 4> b{' ', ' ', ' ', ' '};
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            return (static_cast<std::size_t>(t.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngme::chunk_type> {
        std::size_t operator()(const pngme::chunk_type& t) const noexcept {
            return pngme::chunk_type_hash{}(t);
        }
    };
}
