#include "raybind/error.hpp"

#include <array>
#include <format>

namespace raybind {

namespace {

struct CodeEntry {
  std::string_view name;
  ErrorKind kind;
};

// Indexed by ray_errc_t. Slot 0 is unused (Ok).
constexpr std::array<CodeEntry, 16> kEngineCodes = {{
    {"ok", ErrorKind::BindingInternal},
    {"type", ErrorKind::InvalidArgument},
    {"arity", ErrorKind::InvalidArgument},
    {"length", ErrorKind::InvalidArgument},
    {"domain", ErrorKind::InvalidArgument},
    {"index", ErrorKind::InvalidArgument},
    {"value", ErrorKind::NotFound},
    {"limit", ErrorKind::ResourceExhausted},
    {"os", ErrorKind::EngineInternal},
    {"parse", ErrorKind::InvalidArgument},
    {"nyi", ErrorKind::Unsupported},
    {"user", ErrorKind::InvalidArgument},
    {"cancelled", ErrorKind::Cancelled},
    {"internal", ErrorKind::EngineInternal},
    {"nomem", ErrorKind::ResourceExhausted},
    {"handle", ErrorKind::InvalidArgument},
}};

} // namespace

std::string_view to_string(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::InvalidArgument:
    return "InvalidArgument";
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::ResourceExhausted:
    return "ResourceExhausted";
  case ErrorKind::EngineInternal:
    return "EngineInternal";
  case ErrorKind::Unsupported:
    return "Unsupported";
  case ErrorKind::Cancelled:
    return "Cancelled";
  case ErrorKind::BindingInternal:
    return "BindingInternal";
  }
  return "Unknown";
}

std::string BindError::describe() const {
  if (status != RAY_OK)
    return std::format("{}{}: {} (status {})", to_string(kind),
                       fatal() ? " [fatal]" : "", message, status);
  return std::format("{}: {}", to_string(kind), message);
}

BindError make_error(ErrorKind kind, std::string message) {
  return BindError{kind, Severity::Recoverable, RAY_OK, std::move(message)};
}

ErrorKind translate_kind(StatusCode status) noexcept {
  // Positive values and stray high bits are outside the contract.
  if (!status.well_formed())
    return ErrorKind::BindingInternal;
  uint8_t code = status.engine_code();
  if (code == 0 || code >= kEngineCodes.size())
    return ErrorKind::BindingInternal;
  return kEngineCodes[code].kind;
}

std::string_view engine_code_name(uint8_t code) noexcept {
  if (code == 0 || code >= kEngineCodes.size())
    return "unknown";
  return kEngineCodes[code].name;
}

BindError translate(StatusCode status, std::string_view context,
                    std::string_view engine_message) {
  BindError err;
  err.kind = translate_kind(status);
  err.severity = status.is_fatal() ? Severity::Fatal : Severity::Recoverable;
  err.status = status.raw();

  std::string_view code_name = engine_code_name(status.engine_code());
  if (err.kind == ErrorKind::BindingInternal) {
    err.message = std::format("{}: unrecognized engine status {}", context,
                              status.raw());
  } else if (engine_message.empty()) {
    err.message = std::format("{} failed ({})", context, code_name);
  } else {
    err.message =
        std::format("{} failed ({}): {}", context, code_name, engine_message);
  }
  return err;
}

Error::Error(BindError detail)
    : std::runtime_error(detail.describe()), detail_(std::move(detail)) {}

void throw_error(BindError error) { throw Error(std::move(error)); }

} // namespace raybind
