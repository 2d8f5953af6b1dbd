#pragma once

/**
 * @file error.hpp
 * @brief Error taxonomy and the native status translator.
 *
 * Three layers report failures in three ways:
 *   - The engine returns ray_status_t integers at the C boundary.
 *   - Binding internals return std::expected<T, BindError>.
 *   - The public façade throws raybind::Error.
 *
 * translate() is the only place a ray_status_t becomes an ErrorKind.
 */

#include "raybind/rayforce_abi.h"

#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace raybind {

enum class ErrorKind : uint8_t {
  InvalidArgument,
  NotFound,
  ResourceExhausted,
  EngineInternal,
  Unsupported,
  Cancelled,
  BindingInternal ///< Marshalling mismatch or engine/binding version skew
};

enum class Severity : uint8_t { Recoverable, Fatal };

std::string_view to_string(ErrorKind kind) noexcept;

/**
 * @brief Typed view over a raw ray_status_t.
 */
class StatusCode {
public:
  constexpr StatusCode() noexcept = default;
  constexpr explicit StatusCode(ray_status_t raw) noexcept : raw_(raw) {}

  static constexpr StatusCode recoverable(ray_errc_t code) noexcept {
    return StatusCode(RAY_STATUS(code));
  }
  static constexpr StatusCode fatal(ray_errc_t code) noexcept {
    return StatusCode(RAY_STATUS_FATAL(code));
  }

  constexpr ray_status_t raw() const noexcept { return raw_; }
  constexpr bool ok() const noexcept { return raw_ == RAY_OK; }

  constexpr bool is_fatal() const noexcept {
    return raw_ < 0 && (magnitude() & RAY_FATAL_FLAG) != 0;
  }

  /// Only the low byte and RAY_FATAL_FLAG may be set in an error status.
  constexpr bool well_formed() const noexcept {
    return raw_ <= 0 && (magnitude() & ~int64_t{0xFF | RAY_FATAL_FLAG}) == 0;
  }

  /// Engine error code carried in the low byte (0 for Ok).
  constexpr uint8_t engine_code() const noexcept {
    return raw_ < 0 ? static_cast<uint8_t>(magnitude() & 0xFF) : 0;
  }

  constexpr bool operator==(const StatusCode &) const noexcept = default;

private:
  constexpr int64_t magnitude() const noexcept {
    return -static_cast<int64_t>(raw_);
  }

  ray_status_t raw_ = RAY_OK;
};

/**
 * @brief A failure crossing a binding-internal boundary.
 */
struct BindError {
  ErrorKind kind = ErrorKind::BindingInternal;
  Severity severity = Severity::Recoverable;
  ray_status_t status = RAY_OK; ///< Raw engine status, RAY_OK if binding-side
  std::string message;

  bool fatal() const noexcept { return severity == Severity::Fatal; }

  /// "<kind>: <message>" (plus the raw status when the engine reported it).
  std::string describe() const;
};

template <typename T> using Result = std::expected<T, BindError>;

/// Binding-side failure (no engine status involved).
BindError make_error(ErrorKind kind, std::string message);

inline std::unexpected<BindError> fail(ErrorKind kind, std::string message) {
  return std::unexpected(make_error(kind, std::move(message)));
}

// ===========================================================================
// Error Translator
// ===========================================================================

/// Maps a failing status to its category. Unknown engine codes are
/// BindingInternal. Must not be called with an Ok status.
ErrorKind translate_kind(StatusCode status) noexcept;

/// Engine code name ("type", "arity", ...) or "unknown".
std::string_view engine_code_name(uint8_t code) noexcept;

/**
 * @brief Builds the error for a failing native call.
 * @param status          Non-Ok status returned by the engine.
 * @param context         Entry point or operation name.
 * @param engine_message  Text from ray_last_error (may be empty).
 */
BindError translate(StatusCode status, std::string_view context,
                    std::string_view engine_message = {});

// ===========================================================================
// Public exception
// ===========================================================================

class Error : public std::runtime_error {
public:
  explicit Error(BindError detail);

  ErrorKind kind() const noexcept { return detail_.kind; }
  Severity severity() const noexcept { return detail_.severity; }
  bool fatal() const noexcept { return detail_.fatal(); }
  ray_status_t status() const noexcept { return detail_.status; }
  const BindError &detail() const noexcept { return detail_; }

private:
  BindError detail_;
};

[[noreturn]] void throw_error(BindError error);

/// Returns the value or throws raybind::Error.
template <typename T> T unwrap(Result<T> &&result) {
  if (!result)
    throw_error(std::move(result).error());
  return std::move(*result);
}

inline void unwrap(Result<void> &&result) {
  if (!result)
    throw_error(std::move(result).error());
}

} // namespace raybind
