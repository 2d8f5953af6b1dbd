#include "raybind/build_info.hpp"
#include "raybind/engine.hpp"
#include "raybind/marshal.hpp"
#include "raybind/rayforce_abi.h"
#include "raybind/value.hpp"

#ifndef RAYBIND_VERSION
#define RAYBIND_VERSION "0.0.0"
#endif

namespace raybind {

std::string_view version() noexcept { return RAYBIND_VERSION; }

BuildInfo build_info() {
  BuildInfo info;
  info.version = std::string(version());
  info.abi_version = RAYFORCE_ABI_VERSION;
  info.default_engine = Runtime::default_library_path();

  for (auto t : {ElementType::Bool, ElementType::U8, ElementType::I16,
                 ElementType::I32, ElementType::I64, ElementType::F32,
                 ElementType::F64, ElementType::Timestamp, ElementType::Date,
                 ElementType::Time, ElementType::Guid, ElementType::Symbol,
                 ElementType::Char, ElementType::String, ElementType::Bytes})
    info.element_types.emplace_back(to_string(t));
  for (auto e : {StringEncoding::LengthPrefixed, StringEncoding::NulTerminated})
    info.string_encodings.emplace_back(to_string(e));
  return info;
}

} // namespace raybind
