#include "raybind/handle_registry.hpp"

#include "raybind/log.hpp"

#include <format>

namespace raybind {

std::string_view to_string(HandleKind kind) noexcept {
  switch (kind) {
  case HandleKind::Connection:
    return "connection";
  case HandleKind::Statement:
    return "statement";
  case HandleKind::Cursor:
    return "cursor";
  }
  return "unknown";
}

// ===========================================================================
// HandleRegistry
// ===========================================================================

Result<HandleToken> HandleRegistry::register_handle(HandleKind kind,
                                                    const void *native,
                                                    HandleToken parent,
                                                    Closer closer) {
  if (!native)
    return fail(ErrorKind::BindingInternal,
                std::format("engine returned a null {} handle", to_string(kind)));

  HandleToken token;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (by_native_.contains(native))
      return fail(ErrorKind::BindingInternal,
                  std::format("native {} handle {} is already registered",
                              to_string(kind), native));
    Entry *parent_entry = nullptr;
    if (parent != INVALID_HANDLE) {
      auto it = entries_.find(parent);
      if (it == entries_.end())
        return fail(ErrorKind::InvalidArgument,
                    std::format("parent handle {} is not live", parent));
      parent_entry = &it->second;
    }

    token = next_token_++;
    entries_.emplace(token, Entry{kind, native, parent, std::move(closer)});
    by_native_.emplace(native, token);
    if (parent_entry)
      ++parent_entry->children;
  }
  RAYBIND_LOG_TRACE("registered {} handle {} (parent {})", to_string(kind),
                    token, parent);
  return token;
}

Result<void> HandleRegistry::release(HandleToken token) {
  Entry entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(token);
    if (it == entries_.end())
      return {};
    if (it->second.children > 0)
      return fail(ErrorKind::InvalidArgument,
                  std::format("{} handle {} still has {} live children",
                              to_string(it->second.kind), token,
                              it->second.children));

    entry = std::move(it->second);
    entries_.erase(it);
    by_native_.erase(entry.native);
    if (entry.parent != INVALID_HANDLE) {
      auto parent = entries_.find(entry.parent);
      if (parent != entries_.end())
        --parent->second.children;
    }
  }

  RAYBIND_LOG_TRACE("releasing {} handle {}", to_string(entry.kind), token);
  if (!entry.closer)
    return {};
  StatusCode status(entry.closer());
  if (!status.ok())
    return std::unexpected(translate(
        status, std::format("closing {} handle {}", to_string(entry.kind),
                            token)));
  return {};
}

void HandleRegistry::collect_descendants(HandleToken token,
                                         std::vector<HandleToken> &out) const {
  for (const auto &[child, entry] : entries_) {
    if (entry.parent == token) {
      collect_descendants(child, out);
      out.push_back(child);
    }
  }
}

Result<void> HandleRegistry::release_cascade(HandleToken token) {
  std::vector<HandleToken> order;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    collect_descendants(token, order);
  }
  order.push_back(token);

  Result<void> first;
  for (HandleToken t : order) {
    auto r = release(t);
    if (!r && first)
      first = std::move(r);
  }
  return first;
}

bool HandleRegistry::is_live(HandleToken token) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.contains(token);
}

size_t HandleRegistry::live_children(HandleToken token) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(token);
  return it == entries_.end() ? 0 : it->second.children;
}

size_t HandleRegistry::live_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::optional<HandleKind> HandleRegistry::kind_of(HandleToken token) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(token);
  if (it == entries_.end())
    return std::nullopt;
  return it->second.kind;
}

// ===========================================================================
// ScopedHandle
// ===========================================================================

ScopedHandle::~ScopedHandle() {
  if (auto r = release(); !r)
    RAYBIND_LOG_WARN("handle release failed: {}", r.error().describe());
}

ScopedHandle &ScopedHandle::operator=(ScopedHandle &&other) noexcept {
  if (this != &other) {
    if (auto r = release(); !r)
      RAYBIND_LOG_WARN("handle release failed: {}", r.error().describe());
    registry_ = other.registry_;
    token_ = other.token_;
    other.token_ = INVALID_HANDLE;
  }
  return *this;
}

Result<void> ScopedHandle::release() {
  if (!registry_ || token_ == INVALID_HANDLE)
    return {};
  auto r = registry_->release(token_);
  if (!registry_->is_live(token_))
    token_ = INVALID_HANDLE;
  return r;
}

bool ScopedHandle::is_live() const {
  return registry_ && token_ != INVALID_HANDLE && registry_->is_live(token_);
}

} // namespace raybind
