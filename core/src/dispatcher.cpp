#include "raybind/dispatcher.hpp"

#include <format>
#include <functional>

namespace raybind {

std::string_view to_string(EntryPoint ep) noexcept {
  switch (ep) {
  case EntryPoint::Open:
    return "ray_open";
  case EntryPoint::Close:
    return "ray_close";
  case EntryPoint::Prepare:
    return "ray_prepare";
  case EntryPoint::Finalize:
    return "ray_finalize";
  case EntryPoint::Execute:
    return "ray_execute";
  case EntryPoint::Fetch:
    return "ray_fetch";
  case EntryPoint::FreeResult:
    return "ray_free_result";
  case EntryPoint::CloseCursor:
    return "ray_close_cursor";
  case EntryPoint::LastError:
    return "ray_last_error";
  }
  return "unknown";
}

namespace {

/**
 * @brief Returns an engine batch to the engine exactly once.
 *
 * Non-copyable, non-moveable. release() reports the ray_free_result status;
 * the destructor only logs it.
 */
class BatchGuard {
public:
  using Free = std::function<Result<void>(ray_value_t *)>;

  BatchGuard(ray_value_t *batch, Free free) noexcept
      : batch_(batch), free_(std::move(free)) {}

  ~BatchGuard() {
    if (auto r = release(); !r)
      RAYBIND_LOG_WARN("dropping result batch: {}", r.error().describe());
  }

  BatchGuard(const BatchGuard &) = delete;
  BatchGuard &operator=(const BatchGuard &) = delete;

  Result<void> release() {
    if (!batch_)
      return {};
    ray_value_t *batch = batch_;
    batch_ = nullptr;
    return free_(batch);
  }

private:
  ray_value_t *batch_;
  Free free_;
};

} // namespace

Dispatcher::Dispatcher(std::shared_ptr<Runtime> runtime,
                       StringEncoding encoding)
    : runtime_(std::move(runtime)), encoding_(encoding) {}

Result<void> Dispatcher::admit(const Lock &lock, EntryPoint ep) const {
  if (!lock.owns_lock() || lock.mutex() != &mutex_)
    return fail(ErrorKind::BindingInternal,
                std::format("{} issued without the connection lock",
                            to_string(ep)));
  return check(lock);
}

Result<void> Dispatcher::check(const Lock &) const {
  if (!poisoned())
    return {};
  std::lock_guard<std::mutex> guard(error_mutex_);
  return std::unexpected(*poison_);
}

Result<void> Dispatcher::finish(EntryPoint ep, StatusCode status) {
  if (status.ok())
    return {};

  // The payload of a failed call is never read.
  BindError err =
      translate(status, to_string(ep), engine_last_error(api(), conn_));
  record(err);
  if (err.fatal()) {
    poison(err);
  } else {
    RAYBIND_LOG_DEBUG("{}", err.describe());
  }
  return std::unexpected(std::move(err));
}

void Dispatcher::record(const BindError &error) {
  std::lock_guard<std::mutex> guard(error_mutex_);
  last_error_ = error;
}

void Dispatcher::poison(const BindError &error) {
  {
    std::lock_guard<std::mutex> guard(error_mutex_);
    if (poison_)
      return;
    poison_ = error;
    poisoned_.store(true, std::memory_order_release);
  }
  RAYBIND_LOG_ERROR("{}; connection is no longer usable", error.describe());
}

std::optional<BindError> Dispatcher::poison_error() const {
  std::lock_guard<std::mutex> guard(error_mutex_);
  return poison_;
}

std::optional<BindError> Dispatcher::last_error() const {
  std::lock_guard<std::mutex> guard(error_mutex_);
  return last_error_;
}

Result<void> Dispatcher::free_batch(const Lock &lock, ray_value_t *batch) {
  // Not gated on the poison flag; a fetched batch is always returned.
  if (!lock.owns_lock())
    return fail(ErrorKind::BindingInternal,
                "ray_free_result issued without the connection lock");
  return finish(EntryPoint::FreeResult,
                StatusCode(api().free_result(batch)));
}

Result<std::optional<Table>>
Dispatcher::invoke_fetch(const Lock &lock, ray_cursor_t *cursor,
                         size_t max_rows, const std::atomic<bool> &cancelled) {
  if (cancelled.load(std::memory_order_acquire))
    return fail(ErrorKind::Cancelled, "fetch cancelled");

  ray_value_t *batch = nullptr;
  if (auto ok = invoke(lock, EntryPoint::Fetch,
                       [&] { return api().fetch(cursor, max_rows, &batch); });
      !ok)
    return std::unexpected(std::move(ok).error());

  BatchGuard guard(batch, [this, &lock](ray_value_t *b) {
    return free_batch(lock, b);
  });

  if (cancelled.load(std::memory_order_acquire)) {
    if (auto freed = guard.release(); !freed)
      return std::unexpected(std::move(freed).error());
    return fail(ErrorKind::Cancelled, "fetch cancelled");
  }
  if (!batch)
    return std::optional<Table>();

  auto table = table_from_native(batch);
  auto freed = guard.release();
  if (!table) {
    record(table.error());
    return std::unexpected(std::move(table).error());
  }
  if (!freed)
    return std::unexpected(std::move(freed).error());
  RAYBIND_LOG_TRACE("<- ray_fetch: {} rows x {} columns", table->num_rows(),
                    table->num_columns());
  return std::optional<Table>(std::move(*table));
}

} // namespace raybind
