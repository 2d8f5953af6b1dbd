#pragma once

/**
 * @file platform.hpp
 * @brief Cross-platform OS abstraction for shared library loading.
 *
 * Provides a unified API over:
 *   - POSIX:   dlopen(), dlsym(), dlclose(), dlerror() (Linux/macOS)
 *   - Win32:   LoadLibraryA(), GetProcAddress(), FreeLibrary()
 *
 * All platform-specific headers are confined to this header. The rest of
 * raybind only uses the raybind::platform:: API.
 */

#include <string>

// ============================================================================
// Platform-specific includes
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
#define RAYBIND_PLATFORM_WINDOWS 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#define RAYBIND_PLATFORM_POSIX 1
#include <dlfcn.h>
#endif

namespace raybind::platform {

// ============================================================================
// Library Handle Abstraction
// ============================================================================

#if defined(RAYBIND_PLATFORM_WINDOWS)
using LibraryHandle = HMODULE;
#else
using LibraryHandle = void *;
#endif

/// File name the engine library carries on this platform.
inline constexpr const char *DEFAULT_LIBRARY_NAME =
#if defined(RAYBIND_PLATFORM_WINDOWS)
    "rayforce.dll";
#elif defined(__APPLE__)
    "librayforce.dylib";
#else
    "librayforce.so";
#endif

/**
 * @brief Load a shared library.
 * @param path  File name or path. Bare names use the loader's search path.
 * @return Handle, or nullptr on failure (see last_error_message()).
 */
inline LibraryHandle library_open(const char *path) {
#if defined(RAYBIND_PLATFORM_WINDOWS)
  return LoadLibraryA(path);
#else
  // RTLD_LOCAL: engine symbols stay out of the global namespace.
  return dlopen(path, RTLD_NOW | RTLD_LOCAL);
#endif
}

/**
 * @brief Look up an exported symbol.
 * @return Address, or nullptr if the symbol is absent.
 */
inline void *library_symbol(LibraryHandle h, const char *name) {
  if (!h)
    return nullptr;
#if defined(RAYBIND_PLATFORM_WINDOWS)
  return reinterpret_cast<void *>(GetProcAddress(h, name));
#else
  return dlsym(h, name);
#endif
}

/**
 * @brief Unload a library.
 * @return true on success.
 */
inline bool library_close(LibraryHandle h) {
  if (!h)
    return true;
#if defined(RAYBIND_PLATFORM_WINDOWS)
  return FreeLibrary(h) != 0;
#else
  return dlclose(h) == 0;
#endif
}

/**
 * @brief Loader diagnostic for the most recent failure on this thread.
 */
inline std::string last_error_message() {
#if defined(RAYBIND_PLATFORM_WINDOWS)
  DWORD code = GetLastError();
  if (code == 0)
    return {};
  LPSTR buf = nullptr;
  DWORD len = FormatMessageA(
      FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
          FORMAT_MESSAGE_IGNORE_INSERTS,
      nullptr, code, 0, reinterpret_cast<LPSTR>(&buf), 0, nullptr);
  std::string msg = len ? std::string(buf, len) : "error " + std::to_string(code);
  LocalFree(buf);
  while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r'))
    msg.pop_back();
  return msg;
#else
  const char *err = dlerror();
  return err ? std::string(err) : std::string();
#endif
}

} // namespace raybind::platform
