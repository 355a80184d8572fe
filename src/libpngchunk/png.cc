//
// PNG container decoding, encoding and chunk list editing.
//

#include <pngchunk/png.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <ostream>
#include <sstream>

namespace pngchunk {

    png png::from_chunks(std::vector<chunk> chunks) {
        return png(std::move(chunks));
    }

    png png::decode(const std::byte* data, std::size_t size, const decode_options& options) {
        THROW_PARSE_IF(size < signature.size(), error_code::invalid_header,
                       "Input of ", size, " bytes is too short for the PNG signature");
        THROW_PARSE_UNLESS(std::equal(signature.begin(), signature.end(), data),
                           error_code::invalid_header,
                           "Input does not start with the PNG signature");

        std::vector<chunk> chunks;
        std::size_t pos = signature.size();

        // Each chunk must fit entirely; a short tail fails as truncated
        while (pos < size) {
            chunk c = chunk::decode(data + pos, size - pos, options, pos);
            pos += c.encoded_size();
            chunks.push_back(std::move(c));
        }

        return png(std::move(chunks));
    }

    png png::decode(const std::vector<std::byte>& data, const decode_options& options) {
        return decode(data.data(), data.size(), options);
    }

    std::vector<std::byte> png::encode() const {
        std::vector<std::byte> out;
        out.reserve(encoded_size());
        out.insert(out.end(), signature.begin(), signature.end());
        for (const auto& c : m_chunks) {
            c.encode_to(out);
        }
        return out;
    }

    std::size_t png::encoded_size() const {
        std::size_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += c.encoded_size();
        }
        return total;
    }

    const chunk* png::chunk_by_type(std::string_view name) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [name](const chunk& c) {
            return c.type().to_string() == name;
        });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    chunk png::remove_chunk(std::string_view name) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [name](const chunk& c) {
            return c.type().to_string() == name;
        });
        THROW_USAGE_IF(it == m_chunks.end(), error_code::chunk_not_found,
                       "No chunk of type '", name, "' to remove");

        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    std::string png::to_string() const {
        std::ostringstream oss;
        oss << *this;
        return oss.str();
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        os << "PNG with " << p.size() << (p.size() == 1 ? " chunk" : " chunks") << '\n';
        std::size_t index = 0;
        for (const auto& c : p.chunks()) {
            os << "  [" << index++ << "] " << c << '\n';
        }
        return os;
    }

} // namespace pngchunk
