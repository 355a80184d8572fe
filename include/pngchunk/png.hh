/**
 * @file png.hh
 * @brief PNG file as an ordered list of chunks behind the PNG signature
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/decode_options.hh>

namespace pngchunk {

    /**
     * @class png
     * @brief Container-level view of a PNG file
     *
     * Chunks are kept in file order. Pixel data is never interpreted and no
     * chunk ordering rule (IHDR first, IEND last) is enforced.
     *
     * Example:
     * @code
     *   auto image = pngchunk::png::decode(bytes);
     *   image.append_chunk(pngchunk::chunk(pngchunk::chunk_type::from_name("ruSt"), "hello"));
     *   auto out = image.encode();
     * @endcode
     */
    class PNGCHUNK_EXPORT png {
    public:
        /// The 8-byte PNG signature preceding the chunk stream
        static constexpr std::array<std::byte, 8> signature = {
            std::byte(137), std::byte(80), std::byte(78), std::byte(71),
            std::byte(13), std::byte(10), std::byte(26), std::byte(10)
        };

        png() = default;

        /**
         * @brief Wrap already-built chunks, in the given order, without validation
         */
        static png from_chunks(std::vector<chunk> chunks);

        /**
         * @brief Decode a complete PNG file held in memory
         *
         * All or nothing: the first malformed chunk aborts decoding.
         *
         * @throws parse_error invalid_header, truncated, checksum_mismatch or chunk_too_large
         */
        static png decode(const std::byte* data, std::size_t size, const decode_options& options = {});

        static png decode(const std::vector<std::byte>& data, const decode_options& options = {});

        /**
         * @brief Signature followed by every chunk in order
         */
        [[nodiscard]] std::vector<std::byte> encode() const;

        [[nodiscard]] std::size_t encoded_size() const;

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }
        [[nodiscard]] std::size_t size() const { return m_chunks.size(); }
        [[nodiscard]] bool empty() const { return m_chunks.empty(); }

        /**
         * @brief First chunk whose type name equals name
         * @return Pointer into this container, or nullptr when there is none.
         *         Invalidated by append_chunk and remove_chunk.
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view name) const;

        void append_chunk(chunk c);

        /**
         * @brief Remove and return the first chunk whose type name equals name
         * @throws usage_error (chunk_not_found) leaving the container untouched
         */
        chunk remove_chunk(std::string_view name);

        /**
         * @brief Multi-line listing of the chunks, for diagnostics
         */
        [[nodiscard]] std::string to_string() const;

    private:
        explicit png(std::vector<chunk> chunks) : m_chunks(std::move(chunks)) {}

        std::vector<chunk> m_chunks;
    };

    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const png& p);

} // namespace pngchunk
