#include "raybind/log.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <mutex>

namespace raybind::log {

namespace {

Level level_from_env() noexcept {
  const char *env = std::getenv("RAYBIND_LOG_LEVEL");
  if (!env)
    return Level::Warn;
  return parse_level(env).value_or(Level::Warn);
}

void stderr_sink(Level lvl, std::string_view message) {
  std::fprintf(stderr, "[raybind %.*s] %.*s\n",
               static_cast<int>(level_name(lvl).size()),
               level_name(lvl).data(), static_cast<int>(message.size()),
               message.data());
}

std::atomic<Level> g_level{level_from_env()};

std::mutex g_sink_mutex;
std::shared_ptr<const Sink> g_sink; // null = stderr

} // namespace

Level level() noexcept { return g_level.load(std::memory_order_relaxed); }

void set_level(Level lvl) noexcept {
  g_level.store(lvl, std::memory_order_relaxed);
}

void set_sink(Sink sink) {
  std::shared_ptr<const Sink> next;
  if (sink)
    next = std::make_shared<const Sink>(std::move(sink));
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_sink = std::move(next);
}

void write(Level lvl, std::string_view message) {
  std::shared_ptr<const Sink> sink;
  {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    sink = g_sink;
  }
  // Called outside the lock: a sink may block on a host interpreter lock.
  if (sink)
    (*sink)(lvl, message);
  else
    stderr_sink(lvl, message);
}

std::string_view level_name(Level lvl) noexcept {
  switch (lvl) {
  case Level::Trace:
    return "trace";
  case Level::Debug:
    return "debug";
  case Level::Info:
    return "info";
  case Level::Warn:
    return "warn";
  case Level::Error:
    return "error";
  case Level::Off:
    return "off";
  }
  return "unknown";
}

std::optional<Level> parse_level(std::string_view name) noexcept {
  if (name == "trace")
    return Level::Trace;
  if (name == "debug")
    return Level::Debug;
  if (name == "info")
    return Level::Info;
  if (name == "warn" || name == "warning")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  if (name == "off")
    return Level::Off;
  return std::nullopt;
}

} // namespace raybind::log
