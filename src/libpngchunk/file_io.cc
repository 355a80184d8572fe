//
// Whole-file reading and writing.
//

#include <pngchunk/file_io.hh>
#include <pngchunk/exceptions.hh>

#include <array>
#include <fstream>
#include <istream>
#include <iterator>
#include <ostream>

namespace pngchunk {

    std::vector<std::byte> read_all(std::istream& is) {
        THROW_IO_UNLESS(is.good(), "Stream in bad state");

        std::vector<std::byte> result;
        std::array<char, 4096> buffer;
        while (is) {
            is.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto got = static_cast<std::size_t>(is.gcount());
            auto* first = reinterpret_cast<const std::byte*>(buffer.data());
            result.insert(result.end(), first, first + got);
        }

        THROW_IO_IF(is.bad(), "Stream read failed after ", result.size(), " bytes");
        return result;
    }

    std::vector<std::byte> read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_UNLESS(file.is_open(), "Cannot open file ", path, " for reading");

        try {
            return read_all(file);
        } catch (const io_error& e) {
            THROW_IO("Cannot read file ", path, ": ", e.what());
        }
    }

    void write_all(std::ostream& os, const std::vector<std::byte>& data) {
        THROW_IO_UNLESS(os.good(), "Stream in bad state");

        os.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        os.flush();
        THROW_IO_UNLESS(os.good(), "Stream write of ", data.size(), " bytes failed");
    }

    void write_file(const std::filesystem::path& path, const std::vector<std::byte>& data) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IO_UNLESS(file.is_open(), "Cannot open file ", path, " for writing");

        try {
            write_all(file, data);
        } catch (const io_error& e) {
            THROW_IO("Cannot write file ", path, ": ", e.what());
        }
    }

} // namespace pngchunk
