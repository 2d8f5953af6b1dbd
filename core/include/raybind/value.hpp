#pragma once

/**
 * @file value.hpp
 * @brief Host-side value model for data crossing the engine boundary.
 *
 * Value is a tagged union of scalars (null, bool, int64, double, timestamp,
 * date, time, guid, symbol, string, bytes) and containers (typed array,
 * heterogeneous list, dict, table). Containers are immutable once built and
 * are shared between copies of a Value.
 *
 * Invariants (checked by Array::make / Dict::make / Table::make):
 *   - Every non-null element of an Array has the kind its ElementType maps to.
 *   - Elements of a c8 Array are single-byte strings.
 *   - Elements of an f32 Array hold values already rounded to float.
 *   - Dict keys and values are arrays or lists of the same length.
 *   - All columns of a Table have the same length.
 *   - Column names are non-empty and unique within a table.
 */

#include "raybind/error.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace raybind {

enum class ValueKind : uint8_t {
  Null,
  Bool,
  Int,
  Float,
  Timestamp,
  Date,
  Time,
  Guid,
  Symbol,
  String,
  Bytes,
  Array,
  List,
  Dict,
  Table
};

/// Declared element type of an Array; mirrors the engine's vector types.
enum class ElementType : uint8_t {
  Bool,
  U8,
  I16,
  I32,
  I64,
  F32,
  F64,
  Timestamp,
  Date,
  Time,
  Guid,
  Symbol,
  Char, ///< One byte per element, carried as a one-byte String
  String,
  Bytes
};

std::string_view to_string(ValueKind kind) noexcept;
std::string_view to_string(ElementType type) noexcept;
std::optional<ElementType> parse_element_type(std::string_view name) noexcept;

/// The Value kind an element of `type` carries.
ValueKind element_kind(ElementType type) noexcept;

struct Timestamp {
  int64_t nanos = 0; ///< Nanoseconds since the Unix epoch

  auto operator<=>(const Timestamp &) const = default;
};

struct Date {
  int32_t days = 0; ///< Days since 1970-01-01

  auto operator<=>(const Date &) const = default;
};

struct Time {
  static constexpr int32_t kMillisPerDay = 86'400'000;

  int32_t millis = 0; ///< Milliseconds since midnight, [0, kMillisPerDay)

  bool valid() const noexcept { return millis >= 0 && millis < kMillisPerDay; }
  auto operator<=>(const Time &) const = default;
};

struct Guid {
  std::array<uint8_t, 16> bytes{};

  auto operator<=>(const Guid &) const = default;
};

/// Interned engine name. Distinct from String so it round-trips as a symbol.
struct Symbol {
  std::string name;

  bool operator==(const Symbol &) const = default;
};

struct Bytes {
  std::string data;

  bool operator==(const Bytes &) const = default;
};

class Array;
class List;
class Dict;
class Table;

class Value {
public:
  Value() = default; // null

  static Value null() { return Value(); }
  static Value boolean(bool v) { return Value(Storage(v)); }
  static Value integer(int64_t v) { return Value(Storage(v)); }
  static Value floating(double v) { return Value(Storage(v)); }
  static Value timestamp(Timestamp v) { return Value(Storage(v)); }
  static Value string(std::string v) { return Value(Storage(std::move(v))); }
  static Value date(Date v) { return Value(Storage(v)); }
  static Value time(Time v) { return Value(Storage(v)); }
  static Value guid(Guid v) { return Value(Storage(v)); }
  static Value symbol(Symbol v) { return Value(Storage(std::move(v))); }
  static Value bytes(Bytes v) { return Value(Storage(std::move(v))); }
  static Value array(Array v);
  static Value list(List v);
  static Value dict(Dict v);
  static Value table(Table v);

  ValueKind kind() const noexcept;
  bool is_null() const noexcept {
    return std::holds_alternative<std::monostate>(storage_);
  }

  // Accessors throw std::bad_variant_access on a kind mismatch.
  bool as_bool() const { return std::get<bool>(storage_); }
  int64_t as_int() const { return std::get<int64_t>(storage_); }
  double as_float() const { return std::get<double>(storage_); }
  Timestamp as_timestamp() const { return std::get<Timestamp>(storage_); }
  Date as_date() const { return std::get<Date>(storage_); }
  Time as_time() const { return std::get<Time>(storage_); }
  const Guid &as_guid() const { return std::get<Guid>(storage_); }
  const Symbol &as_symbol() const { return std::get<Symbol>(storage_); }
  const std::string &as_string() const { return std::get<std::string>(storage_); }
  const Bytes &as_bytes() const { return std::get<Bytes>(storage_); }
  const Array &as_array() const;
  const List &as_list() const;
  const Dict &as_dict() const;
  const Table &as_table() const;

  bool operator==(const Value &other) const;

private:
  // Alternative order matches ValueKind.
  using Storage =
      std::variant<std::monostate, bool, int64_t, double, Timestamp, Date,
                   Time, Guid, Symbol, std::string, Bytes,
                   std::shared_ptr<const Array>, std::shared_ptr<const List>,
                   std::shared_ptr<const Dict>, std::shared_ptr<const Table>>;

  explicit Value(Storage storage) : storage_(std::move(storage)) {}

  Storage storage_;
};

class Array {
public:
  /// Unchecked. Prefer make() for data that did not come from the engine.
  explicit Array(ElementType type, std::vector<Value> items = {})
      : type_(type), items_(std::move(items)) {}

  /// Validates `items` and rounds f32 elements to float precision.
  static Result<Array> make(ElementType type, std::vector<Value> items);

  ElementType type() const noexcept { return type_; }
  size_t size() const noexcept { return items_.size(); }
  bool empty() const noexcept { return items_.empty(); }
  const Value &operator[](size_t i) const { return items_[i]; }
  const std::vector<Value> &items() const noexcept { return items_; }

  /// InvalidArgument naming the first element whose kind does not match.
  Result<void> validate() const;

  bool operator==(const Array &) const = default;

private:
  ElementType type_;
  std::vector<Value> items_;
};

/// Heterogeneous sequence; items may be of any kind, containers included.
class List {
public:
  List() = default;
  explicit List(std::vector<Value> items) : items_(std::move(items)) {}

  size_t size() const noexcept { return items_.size(); }
  bool empty() const noexcept { return items_.empty(); }
  const Value &operator[](size_t i) const { return items_[i]; }
  const std::vector<Value> &items() const noexcept { return items_; }

  bool operator==(const List &) const = default;

private:
  std::vector<Value> items_;
};

/// Keys and values held as two parallel sequences (Array or List).
class Dict {
public:
  Dict() : keys_(Value::list(List())), values_(Value::list(List())) {}

  /// InvalidArgument unless both halves are arrays or lists of equal length.
  static Result<Dict> make(Value keys, Value values);

  size_t size() const noexcept;
  const Value &keys() const noexcept { return keys_; }
  const Value &values() const noexcept { return values_; }

  bool operator==(const Dict &) const = default;

private:
  Dict(Value keys, Value values)
      : keys_(std::move(keys)), values_(std::move(values)) {}

  Value keys_;
  Value values_;
};

/// Item count of an Array or List value, nullopt for any other kind.
std::optional<size_t> sequence_size(const Value &value) noexcept;

struct Column {
  std::string name;
  Array data;

  bool operator==(const Column &) const = default;
};

class Table {
public:
  Table() = default;

  static Result<Table> make(std::vector<Column> columns);

  size_t num_columns() const noexcept { return columns_.size(); }
  size_t num_rows() const noexcept {
    return columns_.empty() ? 0 : columns_.front().data.size();
  }
  const std::vector<Column> &columns() const noexcept { return columns_; }
  std::vector<std::string> column_names() const;

  /// nullptr if there is no column called `name`.
  const Column *find(std::string_view name) const noexcept;

  /// True when both tables have the same column names and element types.
  bool same_layout(const Table &other) const noexcept;

  /**
   * @brief Appends the rows of `other`. Both tables must share a layout; a
   *        mismatch is BindingInternal (batches of one result disagree).
   */
  Result<void> append(const Table &other);

  bool operator==(const Table &) const = default;

private:
  explicit Table(std::vector<Column> columns) : columns_(std::move(columns)) {}

  std::vector<Column> columns_;
};

/// Short human-readable rendering, used for logging and host reprs.
std::string format_value(const Value &value);

} // namespace raybind
