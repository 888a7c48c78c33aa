/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for pullstream
 * @author Igor
 * @date 02/09/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the pullstream library.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <sstream>

#include <pullstream/export_pullstream.h>

namespace pullstream {

    /**
     * @class pullstream_error
     * @brief Base exception class for all pullstream errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every pullstream-specific error with a single catch block.
     */
    class PULLSTREAM_EXPORT pullstream_error : public std::runtime_error {
    public:
        explicit pullstream_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for errors while obtaining the input bytes
     *
     * Thrown when a file cannot be opened or read, or when the input
     * exceeds the configured size limit.
     */
    class PULLSTREAM_EXPORT io_error : public pullstream_error {
    public:
        explicit io_error(const std::string& msg)
            : pullstream_error(msg) {}
    };

    /**
     * @class boundary_error
     * @brief Short read: a request exceeded what remains before a boundary
     *
     * Raised by streams (boundary = buffer end) and chunks (boundary = chunk
     * end). The stream position is left untouched when this is thrown.
     */
    class PULLSTREAM_EXPORT boundary_error : public pullstream_error {
    public:
        boundary_error(const std::string& msg, std::size_t position, std::size_t bound, std::size_t requested)
            : pullstream_error(msg)
            , m_position(position)
            , m_bound(bound)
            , m_requested(requested) {}

        /// Absolute stream position when the read was attempted
        [[nodiscard]] std::size_t position() const noexcept { return m_position; }
        /// Exclusive upper bound that would have been crossed
        [[nodiscard]] std::size_t bound() const noexcept { return m_bound; }
        /// Number of bytes the operation asked for
        [[nodiscard]] std::size_t requested() const noexcept { return m_requested; }

    private:
        std::size_t m_position;
        std::size_t m_bound;
        std::size_t m_requested;
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
     * @param ... Variable arguments to format into error message
     */
    #define THROW_IO(...) \
        throw ::pullstream::io_error(::pullstream::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_BOUNDARY
     * @brief Throw a boundary_error
     * @param position Current absolute position
     * @param bound Exclusive upper bound
     * @param requested Number of bytes requested
     * @param ... Context for the message (e.g. "stream end boundary reached")
     *
     * The message always ends with the three diagnostic values so that
     * callers logging only what() still see them.
     */
    #define THROW_BOUNDARY(position, bound, requested, ...)                                   \
        throw ::pullstream::boundary_error(                                                   \
            ::pullstream::build_error_msg("Short read (", __VA_ARGS__, "): position=",        \
                                          (position), " bound=", (bound),                     \
                                          " requested=", (requested)),                        \
            (position), (bound), (requested))

    /** @} */ // end of ExceptionMacros group

} // namespace pullstream
