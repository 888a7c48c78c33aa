/**
 * @file trace.hh
 * @brief Diagnostic trace events emitted by streams and chunks
 * @author Igor
 * @date 03/09/2025
 *
 * Tracing is purely observational: the library never looks at what the
 * handler does, and an empty handler costs nothing beyond a branch.
 */

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <pullstream/export_pullstream.h>

namespace pullstream {

    /**
     * @struct trace_event
     * @brief A single debug-level diagnostic record
     */
    struct PULLSTREAM_EXPORT trace_event {
        std::string_view category;  ///< Emitting component, e.g. "pullstream::chunk"
        std::string_view message;   ///< Short human-readable message
        std::vector<std::pair<std::string_view, std::string>> fields; ///< Name/value pairs

        /**
         * @brief Render as "category: message {name=value, ...}"
         */
        [[nodiscard]] std::string to_string() const;
    };

    /**
     * @typedef trace_handler
     * @brief Callback receiving trace events
     */
    using trace_handler = std::function<void(const trace_event& event)>;

    /**
     * @brief Handler printing every event to stderr
     * @return A handler that writes "[debug] category: message {...}" lines
     */
    PULLSTREAM_EXPORT trace_handler make_stderr_trace_handler();

} // namespace pullstream
