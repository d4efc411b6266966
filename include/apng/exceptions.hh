/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the APNG library
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace apng {

    /**
     * @class apng_error
     * @brief Base exception class for all library errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every APNG-specific error with a single catch block.
     */
    class apng_error : public std::runtime_error {
    public:
        explicit apng_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when file access, reading, writing, or seeking operations fail.
     */
    class io_error : public apng_error {
    public:
        explicit io_error(const std::string& msg)
            : apng_error(msg) {}
    };

    /**
     * @class truncation_error
     * @brief The stream ended in the middle of a read
     */
    class truncation_error : public io_error {
    public:
        explicit truncation_error(const std::string& msg)
            : io_error(msg) {}
    };

    /**
     * @class range_error
     * @brief A seek targeted a position outside the stream
     */
    class range_error : public io_error {
    public:
        explicit range_error(const std::string& msg)
            : io_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for parsing errors
     *
     * Thrown when the container is invalid or its structure cannot be
     * followed safely.
     */
    class parse_error : public apng_error {
    public:
        explicit parse_error(const std::string& msg)
            : apng_error(msg) {}
    };

    /**
     * @class unknown_chunk_error
     * @brief A chunk carries a tag the walker has no policy for
     */
    class unknown_chunk_error : public parse_error {
    public:
        explicit unknown_chunk_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class checksum_error
     * @brief Stored chunk CRC does not match its contents
     */
    class checksum_error : public parse_error {
    public:
        explicit checksum_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class schema_error
     * @brief A record does not fit the schema it is encoded with
     *
     * Raised for missing fields, values of the wrong kind and numeric
     * values that overflow the field width.
     */
    class schema_error : public apng_error {
    public:
        explicit schema_error(const std::string& msg)
            : apng_error(msg) {}
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

    #define THROW_IO(...) \
        throw ::apng::io_error(::apng::build_error_msg(__VA_ARGS__))

    #define THROW_TRUNCATION(...) \
        throw ::apng::truncation_error(::apng::build_error_msg(__VA_ARGS__))

    #define THROW_RANGE(...) \
        throw ::apng::range_error(::apng::build_error_msg(__VA_ARGS__))

    #define THROW_PARSE(...) \
        throw ::apng::parse_error(::apng::build_error_msg(__VA_ARGS__))

    #define THROW_SCHEMA(...) \
        throw ::apng::schema_error(::apng::build_error_msg(__VA_ARGS__))

    #define THROW_UNKNOWN_CHUNK(...) \
        throw ::apng::unknown_chunk_error(::apng::build_error_msg(__VA_ARGS__))

    #define THROW_CHECKSUM(...) \
        throw ::apng::checksum_error(::apng::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_PARSE_IF(condition, ...) \
        do { if (condition) THROW_PARSE(__VA_ARGS__); } while(0)

    #define THROW_SCHEMA_IF(condition, ...) \
        do { if (condition) THROW_SCHEMA(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_PARSE_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_PARSE(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace apng
