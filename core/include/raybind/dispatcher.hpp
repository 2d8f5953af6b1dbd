#pragma once

/**
 * @file dispatcher.hpp
 * @brief Call Dispatcher: the only path from the binding into the engine.
 *
 * One Dispatcher per connection. Its mutex serializes every call through
 * the connection and its children; callers take it with serialize() and
 * pass the lock to each invoke so an unlocked call is caught.
 *
 * Per call:
 *   1. Arguments are marshalled into a NativeValue local to the call.
 *   2. The entry point runs (blocking).
 *   3. The status is checked before any payload is read. On failure the
 *      engine's last error text is attached and the status translated.
 *   4. A fatal status poisons the dispatcher: every later invoke fails with
 *      the same error and never reaches the engine.
 */

#include "raybind/engine.hpp"
#include "raybind/error.hpp"
#include "raybind/log.hpp"
#include "raybind/marshal.hpp"
#include "raybind/value.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <span>

namespace raybind {

enum class EntryPoint : uint8_t {
  Open,
  Close,
  Prepare,
  Finalize,
  Execute,
  Fetch,
  FreeResult,
  CloseCursor,
  LastError
};

/// C symbol name of the entry point ("ray_open", ...).
std::string_view to_string(EntryPoint ep) noexcept;

class Dispatcher {
public:
  using Lock = std::unique_lock<std::mutex>;

  explicit Dispatcher(std::shared_ptr<Runtime> runtime,
                      StringEncoding encoding = StringEncoding::LengthPrefixed);

  Dispatcher(const Dispatcher &) = delete;
  Dispatcher &operator=(const Dispatcher &) = delete;

  /// Connection whose ray_last_error() text is attached to failures.
  /// NULL (the default) reads the process-level error.
  void attach(ray_conn_t *conn) noexcept { conn_ = conn; }

  [[nodiscard]] Lock serialize() { return Lock(mutex_); }

  /**
   * @brief Run one entry point.
   * @param call  Returns the raw ray_status_t of the native call.
   */
  template <typename Call>
  Result<void> invoke(const Lock &lock, EntryPoint ep, Call &&call) {
    if (auto ok = admit(lock, ep); !ok)
      return ok;
    RAYBIND_LOG_TRACE("-> {}", to_string(ep));
    return finish(ep, StatusCode(call()));
  }

  /**
   * @brief Marshal `args`, then run `call(params, count)`.
   *
   * The marshalled buffers live exactly as long as the call.
   */
  template <typename Call>
  Result<void> invoke_with(const Lock &lock, EntryPoint ep,
                           std::span<const Value> args, Call &&call) {
    if (auto ok = admit(lock, ep); !ok)
      return ok;
    auto native = to_native(args, encoding_);
    if (!native)
      return std::unexpected(std::move(native).error());
    RAYBIND_LOG_TRACE("-> {} ({} args, {} bytes)", to_string(ep),
                      native->size(), native->buffer_bytes());
    return finish(ep, StatusCode(call(native->get(), native->size())));
  }

  /**
   * @brief Fetch and decode the next batch of `cursor`.
   *
   * The engine batch is freed through ray_free_result() on every path.
   * If `cancelled` is set before or during the call the batch is dropped
   * and the result is Cancelled.
   *
   * @return std::nullopt once the cursor is exhausted.
   */
  Result<std::optional<Table>> invoke_fetch(const Lock &lock,
                                            ray_cursor_t *cursor,
                                            size_t max_rows,
                                            const std::atomic<bool> &cancelled);

  /// Fails with the stored fatal error once poisoned.
  Result<void> check(const Lock &lock) const;

  bool poisoned() const noexcept {
    return poisoned_.load(std::memory_order_acquire);
  }
  std::optional<BindError> poison_error() const;

  /// Most recent failure seen by this dispatcher.
  std::optional<BindError> last_error() const;

  /// Record a failure that did not come from invoke() (e.g. a closer).
  void record(const BindError &error);

  /// Poison with `error` unless already poisoned.
  void poison(const BindError &error);

  Runtime &runtime() noexcept { return *runtime_; }
  const EngineApi &api() const noexcept { return runtime_->api(); }
  StringEncoding encoding() const noexcept { return encoding_; }

private:
  Result<void> admit(const Lock &lock, EntryPoint ep) const;
  Result<void> finish(EntryPoint ep, StatusCode status);
  Result<void> free_batch(const Lock &lock, ray_value_t *batch);

  std::shared_ptr<Runtime> runtime_;
  StringEncoding encoding_;
  ray_conn_t *conn_ = nullptr;
  std::mutex mutex_;

  // poison_ and last_error_ are guarded by error_mutex_; poisoned_ mirrors
  // poison_ for lock-free reads.
  std::atomic<bool> poisoned_{false};
  mutable std::mutex error_mutex_;
  std::optional<BindError> poison_;
  std::optional<BindError> last_error_;
};

} // namespace raybind
