/**
 * @file chunk_type.hh
 * @brief Four-byte PNG chunk type code and its naming-convention bits
 *
 * The case of each letter in a chunk type carries a flag (bit 5, value 32):
 * ancillary, private, reserved and safe-to-copy, in byte order.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>

#include <pngchunk/exceptions.hh>

namespace pngchunk {
    class chunk_type {
    public:
        static constexpr std::size_t size = 4;

        // Default constructor - all zero bytes, not a valid type
        constexpr chunk_type() = default;

        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : m_bytes{ std::byte(c0), std::byte(c1), std::byte(c2), std::byte(c3) } {}

        constexpr explicit chunk_type(const std::array<std::byte, size>& bytes)
            : m_bytes(bytes) {}

        // Raw bytes as found in a file; no validation
        static chunk_type from_bytes(const void* data) {
            chunk_type result;
            std::memcpy(result.m_bytes.data(), data, size);
            return result;
        }

        /**
         * @brief Construct from a chunk name such as "ruSt"
         * @throws usage_error (invalid_type_name) unless name is exactly 4 ASCII letters
         */
        static chunk_type from_name(std::string_view name) {
            THROW_USAGE_IF(name.size() != size, error_code::invalid_type_name,
                           "Chunk type name '", name, "' must be exactly 4 characters, got ", name.size());
            THROW_USAGE_IF(!std::all_of(name.begin(), name.end(), is_ascii_letter),
                           error_code::invalid_type_name,
                           "Chunk type name '", name, "' must contain only ASCII letters");
            return {name[0], name[1], name[2], name[3]};
        }

        [[nodiscard]] constexpr const std::array<std::byte, size>& bytes() const { return m_bytes; }

        // Ancillary bit (byte 0) clear
        [[nodiscard]] constexpr bool is_critical() const { return !flag(0); }

        // Private bit (byte 1) clear
        [[nodiscard]] constexpr bool is_public() const { return !flag(1); }

        // Reserved bit (byte 2) must be clear in this version of PNG
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return !flag(2); }

        // Safe-to-copy bit (byte 3) set
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return flag(3); }

        [[nodiscard]] bool is_valid() const {
            return std::all_of(m_bytes.begin(), m_bytes.end(), [](std::byte b) {
                return is_ascii_letter(static_cast<char>(b));
            }) && is_reserved_bit_valid();
        }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), size};
        }

        // Big-endian integer view, as stored in the file
        [[nodiscard]] std::uint32_t to_uint32() const {
            return (std::uint32_t(m_bytes[0]) << 24) | (std::uint32_t(m_bytes[1]) << 16) |
                   (std::uint32_t(m_bytes[2]) << 8) | std::uint32_t(m_bytes[3]);
        }

        void to_bytes(void* dest) const {
            std::memcpy(dest, m_bytes.data(), size);
        }

        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

        // Stream output
        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            if (os.flags() & std::ios::hex) {
                auto flags = os.flags();
                auto fill = os.fill();
                os << "0x" << std::hex << std::setfill('0') << std::setw(8) << t.to_uint32();
                os.flags(flags);
                os.fill(fill);
            } else {
                os << '\'';
                for (std::byte b : t.m_bytes) {
                    auto c = static_cast<unsigned char>(b);
                    if (c >= 32 && c <= 126) {
                        os << static_cast<char>(c);
                    } else {
                        // Escape non-printable characters
                        auto flags = os.flags();
                        auto fill = os.fill();
                        os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                           << static_cast<unsigned>(c);
                        os.flags(flags);
                        os.fill(fill);
                    }
                }
                os << '\'';
            }
            return os;
        }

        static constexpr bool is_ascii_letter(char c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

    private:
        [[nodiscard]] constexpr bool flag(std::size_t i) const {
            return (m_bytes[i] & std::byte{0x20}) != std::byte{0};
        }

        std::array<std::byte, size> m_bytes{};
    };

    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            return (static_cast<std::size_t>(t.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for compile-time chunk types: "IEND"_ct
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != chunk_type::size) {
            throw std::invalid_argument("Chunk type literal must be exactly 4 characters");
        }
        for (std::size_t i = 0; i < len; i++) {
            if (!chunk_type::is_ascii_letter(str[i])) {
                throw std::invalid_argument("Chunk type literal must contain only ASCII letters");
            }
        }
        return {str[0], str[1], str[2], str[3]};
    }

    // Critical chunks defined by the PNG standard
    namespace chunk_id {
        inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
        inline constexpr chunk_type PLTE('P', 'L', 'T', 'E');
        inline constexpr chunk_type IDAT('I', 'D', 'A', 'T');
        inline constexpr chunk_type IEND('I', 'E', 'N', 'D');
    }
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
