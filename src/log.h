#pragma once
#include <functional>
#include <format>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

namespace transitgraph {

using TextLogger = std::function<void(std::string_view)>;

inline TextLogger OstreamLogger(std::ostream& os) {
    return [&os](std::string_view msg) { os << msg << "\n"; };
}

inline TextLogger NullLogger() {
    return [](std::string_view) {};
}

// Prepends `prefix` to every message before handing it to `log`.
inline TextLogger PrefixLogger(TextLogger log, std::string prefix) {
    return [log = std::move(log),
            prefix = std::move(prefix)](std::string_view msg) {
        log(std::format("{}{}", prefix, msg));
    };
}

}  // namespace transitgraph
