//
// Chunk construction, decoding and encoding.
//

#include <pngchunk/chunk.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

#include <zlib.h>

#include <cstring>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>

namespace pngchunk {

    namespace {
        std::string hex32(std::uint32_t value) {
            std::ostringstream oss;
            oss << "0x" << std::hex << std::setfill('0') << std::setw(8) << value;
            return oss.str();
        }

        void warn(const decode_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }
    }

    std::uint32_t chunk_crc(const chunk_type& type, const std::byte* data, std::size_t size) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(type.bytes().data()), chunk_type::size);
        if (size > 0) {
            crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(size));
        }
        return static_cast<std::uint32_t>(crc);
    }

    bool is_valid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            auto c = static_cast<unsigned char>(data[i]);
            if (c < 0x80) {
                i++;
                continue;
            }

            std::size_t extra;
            std::uint32_t cp;
            std::uint32_t min_cp;
            if ((c & 0xE0) == 0xC0) {
                extra = 1; cp = c & 0x1F; min_cp = 0x80;
            } else if ((c & 0xF0) == 0xE0) {
                extra = 2; cp = c & 0x0F; min_cp = 0x800;
            } else if ((c & 0xF8) == 0xF0) {
                extra = 3; cp = c & 0x07; min_cp = 0x10000;
            } else {
                return false;
            }

            if (size - i <= extra) {
                return false;
            }
            for (std::size_t k = 1; k <= extra; k++) {
                auto cc = static_cast<unsigned char>(data[i + k]);
                if ((cc & 0xC0) != 0x80) {
                    return false;
                }
                cp = (cp << 6) | (cc & 0x3F);
            }

            // overlong forms, UTF-16 surrogates and values past U+10FFFF
            if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return false;
            }
            i += extra + 1;
        }
        return true;
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_type(type), m_data(std::move(data)), m_crc(0) {
        THROW_USAGE_IF(m_data.size() > max_png_chunk_length, error_code::chunk_too_large,
                       "Chunk ", m_type, " data of ", m_data.size(),
                       " bytes exceeds the PNG limit of ", max_png_chunk_length, " bytes");
        m_crc = chunk_crc(m_type, m_data.data(), m_data.size());
    }

    chunk::chunk(chunk_type type, std::string_view text)
        : chunk(type, std::vector<std::byte>(reinterpret_cast<const std::byte*>(text.data()),
                                             reinterpret_cast<const std::byte*>(text.data()) + text.size())) {
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data, std::uint32_t crc)
        : m_type(type), m_data(std::move(data)), m_crc(crc) {
    }

    chunk chunk::decode(const std::byte* data, std::size_t size,
                        const decode_options& options, std::uint64_t offset) {
        THROW_PARSE_IF(size < 8, error_code::truncated,
                       "Chunk at offset ", offset, " needs 8 bytes for its length and type, only ",
                       size, " available");

        std::uint32_t length = load_be32(data);
        chunk_type type = chunk_type::from_bytes(data + 4);

        // The whole record must be present before its length is judged
        std::uint64_t needed = overhead + std::uint64_t(length);
        THROW_PARSE_IF(size < needed, error_code::truncated,
                       "Chunk ", type, " at offset ", offset, " declares ", length,
                       " data bytes and needs ", needed, " bytes, only ", size, " available");

        if (length > options.max_chunk_size) {
            if (options.strict) {
                THROW_PARSE(error_code::chunk_too_large,
                            "Chunk ", type, " at offset ", offset, " has length ", length,
                            " bytes, which exceeds maximum allowed size of ",
                            options.max_chunk_size, " bytes");
            }
            warn(options, offset, "size_limit",
                 build_error_msg("Chunk ", type, " length ", length, " exceeds maximum ",
                                 options.max_chunk_size));
        }

        if (!type.is_valid()) {
            warn(options, offset, "invalid_type",
                 build_error_msg("Chunk type ", type, " does not follow the PNG naming rules"));
        }

        const std::byte* payload = data + 8;
        std::uint32_t stored = load_be32(payload + length);
        std::uint32_t computed = chunk_crc(type, payload, length);
        THROW_PARSE_IF(stored != computed, error_code::checksum_mismatch,
                       "Chunk ", type, " at offset ", offset, " has CRC ", hex32(stored),
                       ", expected ", hex32(computed));

        return chunk(type, std::vector<std::byte>(payload, payload + length), stored);
    }

    chunk chunk::decode(const std::vector<std::byte>& data, const decode_options& options) {
        return decode(data.data(), data.size(), options);
    }

    std::string chunk::data_as_string() const {
        THROW_USAGE_IF(!is_valid_utf8(m_data.data(), m_data.size()), error_code::invalid_encoding,
                       "Chunk ", m_type, " data is not valid UTF-8");
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::byte> chunk::encode() const {
        std::vector<std::byte> out;
        out.reserve(encoded_size());
        encode_to(out);
        return out;
    }

    void chunk::encode_to(std::vector<std::byte>& out) const {
        std::size_t start = out.size();
        out.resize(start + encoded_size());
        std::byte* p = out.data() + start;

        store_be32(length(), p);
        m_type.to_bytes(p + 4);
        if (!m_data.empty()) {
            std::memcpy(p + 8, m_data.data(), m_data.size());
        }
        store_be32(m_crc, p + 8 + m_data.size());
    }

    std::string chunk::to_string() const {
        std::ostringstream oss;
        oss << *this;
        return oss.str();
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        auto flags = os.flags();
        os << std::dec << "length=" << c.length()
           << " type=" << c.type()
           << " data=" << c.data().size() << " bytes"
           << " crc=" << hex32(c.crc());
        os.flags(flags);
        return os;
    }

} // namespace pngchunk
