/**
 * @file chunk.hh
 * @brief A single length-prefixed, CRC-protected PNG chunk
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/decode_options.hh>

namespace pngchunk {

    /**
     * @class chunk
     * @brief Chunk type plus opaque payload, with its length and CRC
     *
     * On disk a chunk is laid out as
     * @code
     *   length (u32 BE) | type (4 bytes) | data (length bytes) | crc (u32 BE)
     * @endcode
     * where crc is CRC-32 over type and data. The length and crc held by a
     * chunk always match its type and data; a chunk is never modified after
     * construction.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        /// Bytes taken by the length, type and crc fields together
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Build a chunk, computing its length and CRC
         * @throws usage_error (chunk_too_large) if data is longer than 2^31-1 bytes
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Build a chunk holding the bytes of a text message
         */
        chunk(chunk_type type, std::string_view text);

        /**
         * @brief Decode the chunk at the front of a buffer
         *
         * Consumes exactly encoded_size() bytes; anything after that is
         * left to the caller.
         *
         * @param data Start of the buffer
         * @param size Number of bytes available
         * @param options Size limit and warning settings
         * @param offset Position of data within the enclosing file, used in
         *        messages and warnings
         * @throws parse_error truncated, checksum_mismatch or chunk_too_large
         */
        static chunk decode(const std::byte* data, std::size_t size,
                            const decode_options& options = {},
                            std::uint64_t offset = 0);

        static chunk decode(const std::vector<std::byte>& data,
                            const decode_options& options = {});

        [[nodiscard]] std::uint32_t length() const { return static_cast<std::uint32_t>(m_data.size()); }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }

        /**
         * @brief Payload interpreted as UTF-8 text
         * @throws usage_error (invalid_encoding) if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief Canonical on-disk representation
         */
        [[nodiscard]] std::vector<std::byte> encode() const;

        /**
         * @brief Append the canonical representation to an existing buffer
         */
        void encode_to(std::vector<std::byte>& out) const;

        [[nodiscard]] std::size_t encoded_size() const { return overhead + m_data.size(); }

        [[nodiscard]] std::string to_string() const;

        bool operator==(const chunk& o) const {
            return m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(chunk_type type, std::vector<std::byte> data, std::uint32_t crc);

        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

    /**
     * @brief CRC-32 (ISO-HDLC, as used by zlib and PNG) over type and data
     */
    PNGCHUNK_EXPORT std::uint32_t chunk_crc(const chunk_type& type, const std::byte* data, std::size_t size);

    /**
     * @brief Check that a byte range is well-formed UTF-8
     */
    PNGCHUNK_EXPORT bool is_valid_utf8(const std::byte* data, std::size_t size);

} // namespace pngchunk
