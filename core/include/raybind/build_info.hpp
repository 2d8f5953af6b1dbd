#pragma once

/**
 * @file build_info.hpp
 * @brief What this build of the binding speaks: its own version, the engine
 *        contract revision and the value types the marshaller carries.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace raybind {

struct BuildInfo {
  std::string version;        ///< Binding version (the CMake project version)
  uint32_t abi_version = 0;   ///< RAYFORCE_ABI_VERSION compiled in
  std::string default_engine; ///< Library Runtime::load() opens by default
  std::vector<std::string> element_types;    ///< Array element type names
  std::vector<std::string> string_encodings; ///< Accepted by ConnectOptions
};

std::string_view version() noexcept;

BuildInfo build_info();

} // namespace raybind
