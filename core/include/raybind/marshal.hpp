#pragma once

/**
 * @file marshal.hpp
 * @brief Type Marshaller: Value <-> ray_value_t descriptor trees.
 *
 * to_native() builds a descriptor tree whose buffers are owned by the
 * returned NativeValue; the tree stays valid until the NativeValue is
 * destroyed, and moving the NativeValue does not move any buffer.
 *
 * from_native() only reads. Descriptor trees produced by the engine are
 * freed by the caller through ray_free_result(), never here.
 *
 * Narrowing into u8/i16/i32 elements is range checked and f32 elements must
 * be exactly representable; either failure is InvalidArgument, as is host
 * text that is not valid UTF-8. Malformed native input (unknown tags,
 * non-zero reserved bytes, bad encodings, invalid UTF-8 in string or symbol
 * payloads, truncated buffers, inconsistent containers) is BindingInternal.
 */

#include "raybind/error.hpp"
#include "raybind/rayforce_abi.h"
#include "raybind/value.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace raybind {

enum class StringEncoding : uint8_t {
  LengthPrefixed = RAY_STR_LENGTH_PREFIXED,
  NulTerminated = RAY_STR_NUL_TERMINATED
};

std::string_view to_string(StringEncoding encoding) noexcept;

namespace detail {
class NativeBuilder;
}

/**
 * @brief Host-owned descriptor tree handed to the engine for one call.
 *
 * Move-only. get() points at size() contiguous top-level descriptors.
 */
class NativeValue {
public:
  NativeValue() = default;
  NativeValue(NativeValue &&) noexcept = default;
  NativeValue &operator=(NativeValue &&) noexcept = default;
  NativeValue(const NativeValue &) = delete;
  NativeValue &operator=(const NativeValue &) = delete;

  const ray_value_t *get() const noexcept {
    return root_count_ == 0 ? nullptr : nodes_.front().data();
  }
  size_t size() const noexcept { return root_count_; }
  bool empty() const noexcept { return root_count_ == 0; }

  /// Total payload bytes held (data, validity and name buffers).
  size_t buffer_bytes() const noexcept { return buffer_bytes_; }

private:
  friend class detail::NativeBuilder;

  // Inner vectors are never resized after their address is published.
  std::vector<std::vector<ray_value_t>> nodes_;
  std::vector<std::vector<uint8_t>> buffers_;
  std::vector<std::vector<const char *>> name_tables_;
  size_t root_count_ = 0;
  size_t buffer_bytes_ = 0;
};

/// One top-level descriptor for `value`.
Result<NativeValue> to_native(const Value &value,
                              StringEncoding encoding =
                                  StringEncoding::LengthPrefixed);

/// A contiguous parameter list, as ray_execute() expects it.
Result<NativeValue> to_native(std::span<const Value> values,
                              StringEncoding encoding =
                                  StringEncoding::LengthPrefixed);

Result<Value> from_native(const ray_value_t *value);

/// Decodes a RAY_TYPE_TABLE descriptor (the shape of every fetched batch).
Result<Table> table_from_native(const ray_value_t *value);

} // namespace raybind
