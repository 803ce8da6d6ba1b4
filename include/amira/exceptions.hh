/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the Amira library
 * @author Igor
 * @date 10/10/2026
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the Amira library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <cstddef>
#include <utility>

namespace amira {

    /**
     * @class amira_error
     * @brief Base exception class for all Amira-related errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch all Amira-specific errors with a single catch block.
     */
    class amira_error : public std::runtime_error {
    public:
        explicit amira_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when reading from the underlying byte source fails.
     */
    class io_error : public amira_error {
    public:
        explicit io_error(const std::string& msg)
            : amira_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for parsing errors
     *
     * Thrown when the file content violates the Amira file structure
     * or a configured safety limit.
     */
    class parse_error : public amira_error {
    public:
        explicit parse_error(const std::string& msg)
            : amira_error(msg) {}
    };

    /**
     * @class format_error
     * @brief The file does not start with a recognizable designation line
     */
    class format_error : public parse_error {
    public:
        explicit format_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class stream_error
     * @brief Structural violation found while walking the data streams
     *
     * Raised for missing mandatory streams or groups, group nesting
     * violations, unknown stream keywords, item count mismatches and
     * truncated stream payloads. Always fatal for the current file.
     */
    class stream_error : public parse_error {
    public:
        explicit stream_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class syntax_error
     * @brief Header text does not conform to the header grammar
     *
     * Carries the line the parser stopped at and the unconsumed
     * remainder of the header text.
     */
    class syntax_error : public parse_error {
    public:
        syntax_error(const std::string& msg, std::size_t line, std::string remainder)
            : parse_error(msg + " (line " + std::to_string(line) + ")"),
              m_line(line),
              m_remainder(std::move(remainder)) {}

        [[nodiscard]] std::size_t line() const noexcept { return m_line; }
        [[nodiscard]] const std::string& remainder() const noexcept { return m_remainder; }

    private:
        std::size_t m_line;
        std::string m_remainder;
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
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::amira::io_error(::amira::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error with formatted message
     */
    #define THROW_PARSE(...) \
        throw ::amira::parse_error(::amira::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_FORMAT
     * @brief Throw a format_error with formatted message
     */
    #define THROW_FORMAT(...) \
        throw ::amira::format_error(::amira::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_STREAM
     * @brief Throw a stream_error with formatted message
     */
    #define THROW_STREAM(...) \
        throw ::amira::stream_error(::amira::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_PARSE_IF(condition, ...) \
        do { if (condition) THROW_PARSE(__VA_ARGS__); } while(0)

    #define THROW_STREAM_IF(condition, ...) \
        do { if (condition) THROW_STREAM(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_PARSE_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_PARSE(__VA_ARGS__); } while(0)

    #define THROW_STREAM_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_STREAM(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace amira
