/**
 * @file stream_options.hh
 * @brief Configuration options for pull streams
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <cstdint>

#include <pullstream/trace.hh>

namespace pullstream {

    /**
     * @struct stream_options
     * @brief Configuration options for loading and reading a pull stream
     *
     * Options are copied into the stream at construction and shared with
     * every chunk derived from it.
     */
    struct stream_options {
        /**
         * @brief Maximum input size accepted by the loaders, in bytes
         *
         * Inputs larger than this are rejected with an io_error before
         * any memory is allocated for them. Default is 4GB.
         */
        std::uint64_t max_input_size = std::uint64_t(1) << 32;  // 4GB

        /**
         * @brief Optional trace handler
         *
         * If set, receives debug events for chunk creation and capacity
         * checks. If not set, tracing is disabled.
         */
        trace_handler on_trace;
    };

} // namespace pullstream
