#pragma once

/**
 * @file log.hpp
 * @brief Leveled diagnostic logging with a replaceable sink.
 *
 * The binding layer never talks to a host logging framework directly. It
 * formats messages with std::format and hands them to the installed sink.
 * The default sink writes to stderr; the Python module replaces it with a
 * bridge into `logging.getLogger("rayforce")`.
 *
 * The initial level comes from the RAYBIND_LOG_LEVEL environment variable
 * (trace, debug, info, warn, error, off) and defaults to warn.
 *
 * Never log from destructors that can run after the host interpreter has
 * shut down; sinks may call back into the host.
 */

#include <cstdint>
#include <format>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace raybind::log {

enum class Level : uint8_t { Trace, Debug, Info, Warn, Error, Off };

using Sink = std::function<void(Level, std::string_view)>;

/// Current threshold. Messages below it are dropped before formatting.
Level level() noexcept;
void set_level(Level level) noexcept;

inline bool enabled(Level lvl) noexcept {
  return lvl != Level::Off && lvl >= level();
}

/// Install a sink. An empty function restores the stderr sink.
void set_sink(Sink sink);

/// Deliver an already formatted message to the sink.
void write(Level lvl, std::string_view message);

std::string_view level_name(Level lvl) noexcept;
std::optional<Level> parse_level(std::string_view name) noexcept;

template <typename... Args>
void logf(Level lvl, std::format_string<Args...> fmt, Args &&...args) {
  if (!enabled(lvl))
    return;
  write(lvl, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace raybind::log

#define RAYBIND_LOG_TRACE(...)                                                 \
  ::raybind::log::logf(::raybind::log::Level::Trace, __VA_ARGS__)
#define RAYBIND_LOG_DEBUG(...)                                                 \
  ::raybind::log::logf(::raybind::log::Level::Debug, __VA_ARGS__)
#define RAYBIND_LOG_INFO(...)                                                  \
  ::raybind::log::logf(::raybind::log::Level::Info, __VA_ARGS__)
#define RAYBIND_LOG_WARN(...)                                                  \
  ::raybind::log::logf(::raybind::log::Level::Warn, __VA_ARGS__)
#define RAYBIND_LOG_ERROR(...)                                                 \
  ::raybind::log::logf(::raybind::log::Level::Error, __VA_ARGS__)
