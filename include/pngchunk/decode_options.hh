/**
 * @file decode_options.hh
 * @brief Options controlling chunk and PNG decoding
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @brief Largest chunk length allowed by the PNG standard (2^31 - 1)
     */
    inline constexpr std::uint32_t max_png_chunk_length = 0x7FFFFFFFu;

    /**
     * @struct decode_options
     * @brief Configuration options for decoding chunks and PNG streams
     */
    struct decode_options {
        /**
         * @brief Strict decoding mode
         *
         * When true, a chunk whose declared length exceeds max_chunk_size
         * fails with chunk_too_large. When false, a "size_limit" warning is
         * reported and decoding goes on (the chunk must still fit in the
         * buffer).
         */
        bool strict = true;

        /**
         * @brief Maximum declared chunk length in bytes
         */
        std::uint32_t max_chunk_size = max_png_chunk_length;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Offset of the chunk the warning refers to
         * @param category Warning category ("size_limit", "invalid_type")
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
         * Receives "size_limit" in non-strict mode, and "invalid_type" in
         * either mode for type codes that break the naming rules. If not set,
         * warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
