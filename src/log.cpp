#include <amstore/log.hpp>

#include <utility>

namespace amstore {

namespace {

auto sink_slot() -> LogSink& {
    static auto sink = LogSink{};
    return sink;
}

}  // anonymous namespace

void set_log_sink(LogSink sink) {
    sink_slot() = std::move(sink);
}

namespace detail {

auto log_enabled() -> bool {
    return static_cast<bool>(sink_slot());
}

void log(LogLevel level, std::string_view message) {
    if (const auto& sink = sink_slot()) sink(level, message);
}

}  // namespace detail

}  // namespace amstore
