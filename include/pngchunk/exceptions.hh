/**
 * @file exceptions.hh
 * @brief Error taxonomy, exception classes and throwing macros
 *
 * Every error raised by the library derives from png_error and carries an
 * error_code, so callers may either catch by class or switch on code().
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <ostream>

namespace pngchunk {

    /**
     * @enum error_code
     * @brief Reason a library operation failed
     */
    enum class error_code {
        invalid_header,     ///< First 8 bytes are not the PNG signature (or fewer than 8 bytes)
        truncated,          ///< A declared field runs past the buffer end, or bytes follow the last chunk
        checksum_mismatch,  ///< Stored CRC differs from the CRC recomputed over type and data
        invalid_type_name,  ///< Chunk type name is not exactly 4 ASCII letters
        invalid_encoding,   ///< Chunk data requested as text is not valid UTF-8
        chunk_not_found,    ///< No chunk with the requested type name
        chunk_too_large,    ///< Chunk length exceeds the allowed maximum
        io                  ///< File access failed
    };

    /**
     * @brief Short, stable name of an error code (e.g. "checksum_mismatch")
     */
    inline const char* to_string(error_code code) {
        switch (code) {
            case error_code::invalid_header:    return "invalid_header";
            case error_code::truncated:         return "truncated";
            case error_code::checksum_mismatch: return "checksum_mismatch";
            case error_code::invalid_type_name: return "invalid_type_name";
            case error_code::invalid_encoding:  return "invalid_encoding";
            case error_code::chunk_not_found:   return "chunk_not_found";
            case error_code::chunk_too_large:   return "chunk_too_large";
            case error_code::io:                return "io";
        }
        // make compiler happy
        return "unknown";
    }

    inline std::ostream& operator<<(std::ostream& os, error_code code) {
        return os << to_string(code);
    }

    /**
     * @class png_error
     * @brief Base exception class for all library errors
     */
    class png_error : public std::runtime_error {
    public:
        png_error(error_code code, const std::string& msg)
            : std::runtime_error(msg), m_code(code) {}

        [[nodiscard]] error_code code() const noexcept { return m_code; }

    private:
        error_code m_code;
    };

    /**
     * @class parse_error
     * @brief Malformed input found while decoding a chunk or a PNG stream
     *
     * Codes: invalid_header, truncated, checksum_mismatch, chunk_too_large.
     */
    class parse_error : public png_error {
    public:
        parse_error(error_code code, const std::string& msg)
            : png_error(code, msg) {}
    };

    /**
     * @class usage_error
     * @brief Request that cannot be satisfied by otherwise well-formed data
     *
     * Codes: invalid_type_name, invalid_encoding, chunk_not_found,
     * chunk_too_large.
     */
    class usage_error : public png_error {
    public:
        usage_error(error_code code, const std::string& msg)
            : png_error(code, msg) {}
    };

    /**
     * @class io_error
     * @brief File opening, reading or writing failed
     */
    class io_error : public png_error {
    public:
        explicit io_error(const std::string& msg)
            : png_error(error_code::io, msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error with the given code and formatted message
     */
    #define THROW_PARSE(code, ...) \
        throw ::pngchunk::parse_error(code, ::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_USAGE
     * @brief Throw a usage_error with the given code and formatted message
     */
    #define THROW_USAGE(code, ...) \
        throw ::pngchunk::usage_error(code, ::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::pngchunk::io_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_PARSE_IF(condition, code, ...) \
        do { if (condition) THROW_PARSE(code, __VA_ARGS__); } while(0)

    #define THROW_USAGE_IF(condition, code, ...) \
        do { if (condition) THROW_USAGE(code, __VA_ARGS__); } while(0)

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_PARSE_UNLESS(condition, code, ...) \
        do { if (!(condition)) THROW_PARSE(code, __VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
