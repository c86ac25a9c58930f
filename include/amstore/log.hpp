/// @file log.hpp
/// @brief Routing of engine diagnostics to the embedding host.
///
/// The engine never writes to stdout/stderr. A host installs a sink and
/// forwards messages to its own log; without one, messages are dropped.

#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

namespace amstore {

enum class LogLevel : std::uint8_t {
    debug,
    info,
    warn,
    error,
};

constexpr auto to_string_view(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::debug: return "debug";
        case LogLevel::info:  return "info";
        case LogLevel::warn:  return "warn";
        case LogLevel::error: return "error";
    }
    return "unknown";
}

using LogSink = std::function<void(LogLevel, std::string_view)>;

/// Install the process-wide sink (an empty function restores the
/// default, which discards). Not synchronized: install before any
/// document is used from more than one thread.
void set_log_sink(LogSink sink);

namespace detail {

/// True when a sink is installed. Callers check it before formatting a
/// message.
auto log_enabled() -> bool;

void log(LogLevel level, std::string_view message);

}  // namespace detail

}  // namespace amstore
