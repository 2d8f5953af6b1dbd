#pragma once

/**
 * @file engine.hpp
 * @brief Engine library loading and the process-scoped Runtime.
 *
 * EngineApi is the resolved function table of rayforce_abi.h. It is filled
 * either from a dlopen()ed librayforce (Runtime::load) or from functions
 * linked into the process (Runtime::attach).
 *
 * A Runtime owns process-wide engine state: the library, the init/shutdown
 * pairing and the handle registry. There is at most one live Runtime per
 * library path; connections share it through std::shared_ptr, so
 * ray_runtime_shutdown() runs after the last connection is gone and before
 * the library is unloaded.
 */

#include "raybind/error.hpp"
#include "raybind/handle_registry.hpp"
#include "raybind/platform.hpp"
#include "raybind/rayforce_abi.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace raybind {

struct EngineApi {
  ray_abi_version_fn abi_version = nullptr;
  ray_runtime_init_fn runtime_init = nullptr;
  ray_runtime_shutdown_fn runtime_shutdown = nullptr;
  ray_open_fn open = nullptr;
  ray_close_fn close = nullptr;
  ray_last_error_fn last_error = nullptr;
  ray_prepare_fn prepare = nullptr;
  ray_finalize_fn finalize = nullptr;
  ray_execute_fn execute = nullptr;
  ray_fetch_fn fetch = nullptr;
  ray_free_result_fn free_result = nullptr;
  ray_close_cursor_fn close_cursor = nullptr;

  /// Calls `visit(symbol_name, slot)` for every entry point.
  template <typename Visitor> void for_each(Visitor &&visit) {
    each(*this, visit);
  }
  template <typename Visitor> void for_each(Visitor &&visit) const {
    each(*this, visit);
  }

  /// Names of the entry points that are still null.
  std::vector<std::string_view> missing() const;
  bool complete() const { return missing().empty(); }

private:
  template <typename Self, typename Visitor>
  static void each(Self &self, Visitor &visit) {
    visit("ray_abi_version", self.abi_version);
    visit("ray_runtime_init", self.runtime_init);
    visit("ray_runtime_shutdown", self.runtime_shutdown);
    visit("ray_open", self.open);
    visit("ray_close", self.close);
    visit("ray_last_error", self.last_error);
    visit("ray_prepare", self.prepare);
    visit("ray_finalize", self.finalize);
    visit("ray_execute", self.execute);
    visit("ray_fetch", self.fetch);
    visit("ray_free_result", self.free_result);
    visit("ray_close_cursor", self.close_cursor);
  }
};

/**
 * @brief Last error text recorded by the engine for `conn` (NULL = process).
 *        Empty if the engine has none or cannot report it.
 */
std::string engine_last_error(const EngineApi &api, ray_conn_t *conn);

// ===========================================================================
// EngineLibrary
// ===========================================================================

/**
 * @brief RAII owner of a dlopen()ed engine library.
 *
 * Non-copyable, moveable.
 */
class EngineLibrary {
public:
  /// NotFound if the loader cannot open `path`.
  static Result<EngineLibrary> open(const std::string &path);

  ~EngineLibrary();

  EngineLibrary(const EngineLibrary &) = delete;
  EngineLibrary &operator=(const EngineLibrary &) = delete;
  EngineLibrary(EngineLibrary &&other) noexcept;
  EngineLibrary &operator=(EngineLibrary &&other) noexcept;

  /**
   * @brief Resolve every entry point.
   * @return NotFound naming the first missing symbol, Unsupported if the
   *         library was built against another ABI revision.
   */
  Result<EngineApi> resolve() const;

  const std::string &path() const noexcept { return path_; }

private:
  EngineLibrary(platform::LibraryHandle handle, std::string path) noexcept
      : handle_(handle), path_(std::move(path)) {}

  void unload() noexcept;

  platform::LibraryHandle handle_ = nullptr;
  std::string path_;
};

/// Checks that `api` is complete and speaks RAYFORCE_ABI_VERSION.
Result<void> check_api(const EngineApi &api, std::string_view origin);

// ===========================================================================
// Runtime
// ===========================================================================

struct RuntimeOptions {
  /// Engine library to load. Empty: $RAYFORCE_LIBRARY, then the platform
  /// default name (librayforce.so / librayforce.dylib / rayforce.dll).
  std::string library_path;
  /// Passed to ray_runtime_init().
  uint32_t init_flags = 0;
};

class Runtime {
public:
  /**
   * @brief Load (or reuse) the runtime for a library path.
   *
   * A live runtime for the same path is returned as is; its init flags are
   * not changed.
   */
  static Result<std::shared_ptr<Runtime>> load(RuntimeOptions options = {});

  /**
   * @brief Runtime over entry points already linked into the process.
   * @param name  Cache key; a live runtime with this name is reused.
   */
  static Result<std::shared_ptr<Runtime>> attach(const EngineApi &api,
                                                 std::string name,
                                                 uint32_t init_flags = 0);

  /// The library path load() uses when RuntimeOptions::library_path is empty.
  static std::string default_library_path();

  ~Runtime();

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  const EngineApi &api() const noexcept { return api_; }
  HandleRegistry &registry() noexcept { return registry_; }
  const HandleRegistry &registry() const noexcept { return registry_; }

  /// Library path, or the attach() name.
  const std::string &name() const noexcept { return name_; }

private:
  Runtime(EngineApi api, std::string name,
          std::optional<EngineLibrary> library) noexcept;

  static Result<std::shared_ptr<Runtime>>
  start(EngineApi api, std::string name, std::optional<EngineLibrary> library,
        uint32_t init_flags);

  // Declared first: unloaded after everything below is gone.
  std::optional<EngineLibrary> library_;
  EngineApi api_;
  std::string name_;
  HandleRegistry registry_;
};

} // namespace raybind
