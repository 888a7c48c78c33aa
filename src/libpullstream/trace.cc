//
// Created by igor on 03/09/2025.
//

#include <pullstream/trace.hh>
#include <cstdio>
#include <iterator>

#include <fmt/format.h>

namespace pullstream {

    std::string trace_event::to_string() const {
        fmt::memory_buffer out;
        fmt::format_to(std::back_inserter(out), "{}: {}", category, message);
        if (!fields.empty()) {
            out.push_back(' ');
            out.push_back('{');
            bool first = true;
            for (const auto& [name, value] : fields) {
                fmt::format_to(std::back_inserter(out), "{}{}={}", first ? "" : ", ", name, value);
                first = false;
            }
            out.push_back('}');
        }
        return fmt::to_string(out);
    }

    trace_handler make_stderr_trace_handler() {
        return [](const trace_event& event) {
            fmt::print(stderr, "[debug] {}\n", event.to_string());
        };
    }

}
