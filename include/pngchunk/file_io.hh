/**
 * @file file_io.hh
 * @brief Whole-file helpers used by tools built on top of the codec
 *
 * The codec itself never touches the filesystem; these helpers move a file's
 * complete contents in and out of memory.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <vector>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @brief Read the remaining contents of a stream
     * @throws io_error if the stream fails
     */
    PNGCHUNK_EXPORT std::vector<std::byte> read_all(std::istream& is);

    /**
     * @brief Read a whole file
     * @throws io_error if the file cannot be opened or read
     */
    PNGCHUNK_EXPORT std::vector<std::byte> read_file(const std::filesystem::path& path);

    /**
     * @brief Write a buffer to a stream
     * @throws io_error if the stream fails
     */
    PNGCHUNK_EXPORT void write_all(std::ostream& os, const std::vector<std::byte>& data);

    /**
     * @brief Create or truncate a file and write a buffer to it
     * @throws io_error if the file cannot be opened or written
     */
    PNGCHUNK_EXPORT void write_file(const std::filesystem::path& path, const std::vector<std::byte>& data);

} // namespace pngchunk
