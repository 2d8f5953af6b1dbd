#pragma once

/**
 * @file handle_registry.hpp
 * @brief Native Handle Registry: liveness tracking for engine handles.
 *
 * Every native handle (connection, statement, cursor) the engine hands out
 * is registered here together with the entry point that closes it. The
 * registry hands back an opaque token; tokens are never reused.
 *
 * Guarantees:
 *   - At most one live registration per native handle.
 *   - release() runs the closer exactly once, outside the registry lock.
 *     Releasing a dead or unknown token is a no-op.
 *   - A parent with live children cannot be released.
 *
 * Thread-safe. Callers serialize the closers themselves (the dispatcher
 * holds the connection mutex around every release).
 */

#include "raybind/error.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace raybind {

enum class HandleKind : uint8_t { Connection, Statement, Cursor };

std::string_view to_string(HandleKind kind) noexcept;

using HandleToken = uint64_t;

/// Never issued by a registry.
inline constexpr HandleToken INVALID_HANDLE = 0;

/// Closes the native handle. Invoked at most once.
using Closer = std::function<ray_status_t()>;

class HandleRegistry {
public:
  HandleRegistry() = default;

  // Non-copyable, non-moveable
  HandleRegistry(const HandleRegistry &) = delete;
  HandleRegistry &operator=(const HandleRegistry &) = delete;

  /**
   * @brief Record a freshly acquired native handle.
   * @param parent  INVALID_HANDLE for roots, otherwise a live token.
   * @return New token. BindingInternal if `native` is already registered,
   *         InvalidArgument if `parent` is not live.
   */
  Result<HandleToken> register_handle(HandleKind kind, const void *native,
                                      HandleToken parent, Closer closer);

  /**
   * @brief Close the native handle and drop the registration.
   *
   * A closer failure is reported, but the handle counts as released: the
   * engine was told to close it and it is never closed twice.
   */
  Result<void> release(HandleToken token);

  /// Release every live descendant (deepest first), then `token` itself.
  /// Returns the first failure; every handle is still attempted.
  Result<void> release_cascade(HandleToken token);

  bool is_live(HandleToken token) const;
  size_t live_children(HandleToken token) const;
  size_t live_count() const;
  std::optional<HandleKind> kind_of(HandleToken token) const;

private:
  struct Entry {
    HandleKind kind = HandleKind::Connection;
    const void *native = nullptr;
    HandleToken parent = INVALID_HANDLE;
    Closer closer;
    size_t children = 0;
  };

  void collect_descendants(HandleToken token,
                           std::vector<HandleToken> &out) const;

  mutable std::mutex mutex_;
  std::unordered_map<HandleToken, Entry> entries_;
  std::unordered_map<const void *, HandleToken> by_native_;
  HandleToken next_token_ = 1;
};

/**
 * @brief Owns one registry token and releases it on destruction.
 *
 * Non-copyable, moveable. A failed release in the destructor is logged at
 * warning level; call release() to observe the error.
 */
class ScopedHandle {
public:
  ScopedHandle() = default;
  ScopedHandle(HandleRegistry &registry, HandleToken token) noexcept
      : registry_(&registry), token_(token) {}

  ~ScopedHandle();

  ScopedHandle(const ScopedHandle &) = delete;
  ScopedHandle &operator=(const ScopedHandle &) = delete;

  ScopedHandle(ScopedHandle &&other) noexcept
      : registry_(other.registry_), token_(other.token_) {
    other.token_ = INVALID_HANDLE;
  }

  ScopedHandle &operator=(ScopedHandle &&other) noexcept;

  /// Explicitly release the handle (idempotent). If the registry refuses
  /// (live children), the handle stays owned.
  Result<void> release();

  HandleToken token() const noexcept { return token_; }
  bool is_live() const;
  explicit operator bool() const noexcept { return token_ != INVALID_HANDLE; }

private:
  HandleRegistry *registry_ = nullptr;
  HandleToken token_ = INVALID_HANDLE;
};

} // namespace raybind
