#include "raybind/engine.hpp"

#include "raybind/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <mutex>
#include <type_traits>
#include <unordered_map>

namespace raybind {

namespace {

constexpr size_t kErrorBufferSize = 512;

// Live runtimes by library path / attach name.
std::mutex g_runtimes_mutex;
std::unordered_map<std::string, std::weak_ptr<Runtime>> g_runtimes;

std::shared_ptr<Runtime> cached_runtime(const std::string &key) {
  auto it = g_runtimes.find(key);
  if (it == g_runtimes.end())
    return nullptr;
  auto rt = it->second.lock();
  if (!rt)
    g_runtimes.erase(it);
  return rt;
}

} // namespace

std::vector<std::string_view> EngineApi::missing() const {
  std::vector<std::string_view> names;
  for_each([&](std::string_view name, const auto &fn) {
    if (!fn)
      names.push_back(name);
  });
  return names;
}

std::string engine_last_error(const EngineApi &api, ray_conn_t *conn) {
  if (!api.last_error)
    return {};
  std::string buf(kErrorBufferSize, '\0');
  size_t len = 0;
  if (api.last_error(conn, buf.data(), buf.size(), &len) != RAY_OK)
    return {};
  if (len >= buf.size()) {
    buf.assign(len + 1, '\0');
    if (api.last_error(conn, buf.data(), buf.size(), &len) != RAY_OK)
      return {};
  }
  buf.resize(std::min(len, buf.size() - 1));
  return buf;
}

// ===========================================================================
// EngineLibrary
// ===========================================================================

Result<EngineLibrary> EngineLibrary::open(const std::string &path) {
  RAYBIND_LOG_DEBUG("loading engine library '{}'", path);
  platform::LibraryHandle handle = platform::library_open(path.c_str());
  if (!handle)
    return fail(ErrorKind::NotFound,
                std::format("cannot load engine library '{}': {}", path,
                            platform::last_error_message()));
  return EngineLibrary(handle, path);
}

EngineLibrary::~EngineLibrary() { unload(); }

EngineLibrary::EngineLibrary(EngineLibrary &&other) noexcept
    : handle_(other.handle_), path_(std::move(other.path_)) {
  other.handle_ = nullptr;
}

EngineLibrary &EngineLibrary::operator=(EngineLibrary &&other) noexcept {
  if (this != &other) {
    unload();
    handle_ = other.handle_;
    path_ = std::move(other.path_);
    other.handle_ = nullptr;
  }
  return *this;
}

void EngineLibrary::unload() noexcept {
  if (!handle_)
    return;
  if (!platform::library_close(handle_))
    RAYBIND_LOG_WARN("unloading '{}' failed: {}", path_,
                     platform::last_error_message());
  handle_ = nullptr;
}

Result<EngineApi> EngineLibrary::resolve() const {
  EngineApi api;
  std::string missing;
  api.for_each([&](std::string_view name, auto &fn) {
    using Fn = std::remove_reference_t<decltype(fn)>;
    fn = reinterpret_cast<Fn>(
        platform::library_symbol(handle_, std::string(name).c_str()));
    if (!fn && missing.empty())
      missing = name;
  });
  if (!missing.empty())
    return fail(ErrorKind::NotFound,
                std::format("engine library '{}' does not export {}", path_,
                            missing));
  if (auto ok = check_api(api, path_); !ok)
    return std::unexpected(std::move(ok).error());
  return api;
}

Result<void> check_api(const EngineApi &api, std::string_view origin) {
  auto missing = api.missing();
  if (!missing.empty())
    return fail(ErrorKind::NotFound,
                std::format("engine '{}' does not provide {}", origin,
                            missing.front()));
  const uint32_t version = api.abi_version();
  if (version != RAYFORCE_ABI_VERSION)
    return fail(ErrorKind::Unsupported,
                std::format("engine '{}' implements ABI version {}, this "
                            "binding requires {}",
                            origin, version, RAYFORCE_ABI_VERSION));
  return {};
}

// ===========================================================================
// Runtime
// ===========================================================================

Runtime::Runtime(EngineApi api, std::string name,
                 std::optional<EngineLibrary> library) noexcept
    : library_(std::move(library)), api_(api), name_(std::move(name)) {}

Runtime::~Runtime() {
  if (size_t live = registry_.live_count(); live > 0)
    RAYBIND_LOG_WARN("runtime '{}' shutting down with {} live handles", name_,
                     live);
  StatusCode status(api_.runtime_shutdown());
  if (!status.ok())
    RAYBIND_LOG_WARN("{}",
                     translate(status, "ray_runtime_shutdown",
                               engine_last_error(api_, nullptr))
                         .describe());
  RAYBIND_LOG_DEBUG("runtime '{}' shut down", name_);
}

std::string Runtime::default_library_path() {
  if (const char *env = std::getenv("RAYFORCE_LIBRARY"); env && *env)
    return env;
  return platform::DEFAULT_LIBRARY_NAME;
}

Result<std::shared_ptr<Runtime>>
Runtime::start(EngineApi api, std::string name,
               std::optional<EngineLibrary> library, uint32_t init_flags) {
  StatusCode status(api.runtime_init(init_flags));
  if (!status.ok())
    return std::unexpected(translate(status, "ray_runtime_init",
                                     engine_last_error(api, nullptr)));
  RAYBIND_LOG_INFO("engine runtime '{}' initialized (flags {:#x})", name,
                   init_flags);
  return std::shared_ptr<Runtime>(
      new Runtime(api, std::move(name), std::move(library)));
}

Result<std::shared_ptr<Runtime>> Runtime::load(RuntimeOptions options) {
  std::string path = options.library_path.empty() ? default_library_path()
                                                  : options.library_path;

  std::lock_guard<std::mutex> lock(g_runtimes_mutex);
  if (auto rt = cached_runtime(path))
    return rt;

  auto library = EngineLibrary::open(path);
  if (!library)
    return std::unexpected(std::move(library).error());
  auto api = library->resolve();
  if (!api)
    return std::unexpected(std::move(api).error());

  auto rt = start(*api, path, std::move(*library), options.init_flags);
  if (rt)
    g_runtimes[path] = *rt;
  return rt;
}

Result<std::shared_ptr<Runtime>>
Runtime::attach(const EngineApi &api, std::string name, uint32_t init_flags) {
  if (auto ok = check_api(api, name); !ok)
    return std::unexpected(std::move(ok).error());

  std::lock_guard<std::mutex> lock(g_runtimes_mutex);
  if (auto rt = cached_runtime(name))
    return rt;

  auto rt = start(api, name, std::nullopt, init_flags);
  if (rt)
    g_runtimes[name] = *rt;
  return rt;
}

} // namespace raybind
