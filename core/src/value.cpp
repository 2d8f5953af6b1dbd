#include "raybind/value.hpp"

#include <cfloat>
#include <cmath>
#include <format>
#include <unordered_set>

namespace raybind {

std::string_view to_string(ValueKind kind) noexcept {
  switch (kind) {
  case ValueKind::Null:
    return "null";
  case ValueKind::Bool:
    return "bool";
  case ValueKind::Int:
    return "int";
  case ValueKind::Float:
    return "float";
  case ValueKind::Timestamp:
    return "timestamp";
  case ValueKind::Date:
    return "date";
  case ValueKind::Time:
    return "time";
  case ValueKind::Guid:
    return "guid";
  case ValueKind::Symbol:
    return "symbol";
  case ValueKind::String:
    return "string";
  case ValueKind::Bytes:
    return "bytes";
  case ValueKind::Array:
    return "array";
  case ValueKind::List:
    return "list";
  case ValueKind::Dict:
    return "dict";
  case ValueKind::Table:
    return "table";
  }
  return "unknown";
}

std::string_view to_string(ElementType type) noexcept {
  switch (type) {
  case ElementType::Bool:
    return "bool";
  case ElementType::U8:
    return "u8";
  case ElementType::I16:
    return "i16";
  case ElementType::I32:
    return "i32";
  case ElementType::I64:
    return "i64";
  case ElementType::F32:
    return "f32";
  case ElementType::F64:
    return "f64";
  case ElementType::Timestamp:
    return "timestamp";
  case ElementType::Date:
    return "date";
  case ElementType::Time:
    return "time";
  case ElementType::Guid:
    return "guid";
  case ElementType::Symbol:
    return "symbol";
  case ElementType::Char:
    return "c8";
  case ElementType::String:
    return "string";
  case ElementType::Bytes:
    return "bytes";
  }
  return "unknown";
}

std::optional<ElementType> parse_element_type(std::string_view name) noexcept {
  for (auto t : {ElementType::Bool, ElementType::U8, ElementType::I16,
                 ElementType::I32, ElementType::I64, ElementType::F32,
                 ElementType::F64, ElementType::Timestamp, ElementType::Date,
                 ElementType::Time, ElementType::Guid, ElementType::Symbol,
                 ElementType::Char, ElementType::String, ElementType::Bytes}) {
    if (to_string(t) == name)
      return t;
  }
  // Aliases accepted from host code
  if (name == "int")
    return ElementType::I64;
  if (name == "float")
    return ElementType::F64;
  if (name == "str")
    return ElementType::String;
  if (name == "sym")
    return ElementType::Symbol;
  if (name == "char")
    return ElementType::Char;
  return std::nullopt;
}

ValueKind element_kind(ElementType type) noexcept {
  switch (type) {
  case ElementType::Bool:
    return ValueKind::Bool;
  case ElementType::U8:
  case ElementType::I16:
  case ElementType::I32:
  case ElementType::I64:
    return ValueKind::Int;
  case ElementType::F32:
  case ElementType::F64:
    return ValueKind::Float;
  case ElementType::Timestamp:
    return ValueKind::Timestamp;
  case ElementType::Date:
    return ValueKind::Date;
  case ElementType::Time:
    return ValueKind::Time;
  case ElementType::Guid:
    return ValueKind::Guid;
  case ElementType::Symbol:
    return ValueKind::Symbol;
  case ElementType::Char:
  case ElementType::String:
    return ValueKind::String;
  case ElementType::Bytes:
    return ValueKind::Bytes;
  }
  return ValueKind::Null;
}

// ===========================================================================
// Value
// ===========================================================================

Value Value::array(Array v) {
  return Value(Storage(std::make_shared<const Array>(std::move(v))));
}

Value Value::list(List v) {
  return Value(Storage(std::make_shared<const List>(std::move(v))));
}

Value Value::dict(Dict v) {
  return Value(Storage(std::make_shared<const Dict>(std::move(v))));
}

Value Value::table(Table v) {
  return Value(Storage(std::make_shared<const Table>(std::move(v))));
}

ValueKind Value::kind() const noexcept {
  return static_cast<ValueKind>(storage_.index());
}

const Array &Value::as_array() const {
  return *std::get<std::shared_ptr<const Array>>(storage_);
}

const List &Value::as_list() const {
  return *std::get<std::shared_ptr<const List>>(storage_);
}

const Dict &Value::as_dict() const {
  return *std::get<std::shared_ptr<const Dict>>(storage_);
}

const Table &Value::as_table() const {
  return *std::get<std::shared_ptr<const Table>>(storage_);
}

bool Value::operator==(const Value &other) const {
  if (storage_.index() != other.storage_.index())
    return false;
  switch (kind()) {
  case ValueKind::Array:
    return as_array() == other.as_array();
  case ValueKind::List:
    return as_list() == other.as_list();
  case ValueKind::Dict:
    return as_dict() == other.as_dict();
  case ValueKind::Table:
    return as_table() == other.as_table();
  default:
    return storage_ == other.storage_;
  }
}

// ===========================================================================
// Array
// ===========================================================================

Result<Array> Array::make(ElementType type, std::vector<Value> items) {
  Array arr(type, std::move(items));
  if (auto ok = arr.validate(); !ok)
    return std::unexpected(std::move(ok).error());
  if (type == ElementType::F32) {
    // Out-of-range values are left alone so encoding reports the overflow.
    for (auto &item : arr.items_) {
      if (item.is_null())
        continue;
      const double v = item.as_float();
      if (std::isfinite(v) && std::fabs(v) > static_cast<double>(FLT_MAX))
        continue;
      item = Value::floating(static_cast<double>(static_cast<float>(v)));
    }
  }
  return arr;
}

Result<void> Array::validate() const {
  const ValueKind want = element_kind(type_);
  for (size_t i = 0; i < items_.size(); ++i) {
    const Value &item = items_[i];
    if (item.is_null())
      continue;
    if (item.kind() == want) {
      if (type_ == ElementType::Char && item.as_string().size() != 1)
        return fail(ErrorKind::InvalidArgument,
                    std::format("array element {} is a {}-byte string, c8 "
                                "holds exactly one byte",
                                i, item.as_string().size()));
      continue;
    }
    return fail(ErrorKind::InvalidArgument,
                std::format("array element {} is {}, array declares {}", i,
                            to_string(item.kind()), to_string(type_)));
  }
  return {};
}

// ===========================================================================
// List / Dict
// ===========================================================================

std::optional<size_t> sequence_size(const Value &value) noexcept {
  switch (value.kind()) {
  case ValueKind::Array:
    return value.as_array().size();
  case ValueKind::List:
    return value.as_list().size();
  default:
    return std::nullopt;
  }
}

Result<Dict> Dict::make(Value keys, Value values) {
  auto nkeys = sequence_size(keys);
  auto nvalues = sequence_size(values);
  if (!nkeys || !nvalues)
    return fail(ErrorKind::InvalidArgument,
                std::format("dict keys and values must be arrays or lists, "
                            "got {} and {}",
                            to_string(keys.kind()), to_string(values.kind())));
  if (*nkeys != *nvalues)
    return fail(ErrorKind::InvalidArgument,
                std::format("dict has {} keys and {} values", *nkeys,
                            *nvalues));
  return Dict(std::move(keys), std::move(values));
}

size_t Dict::size() const noexcept { return sequence_size(keys_).value_or(0); }

// ===========================================================================
// Table
// ===========================================================================

Result<Table> Table::make(std::vector<Column> columns) {
  std::unordered_set<std::string_view> seen;
  for (const auto &col : columns) {
    if (col.name.empty())
      return fail(ErrorKind::InvalidArgument, "table column name is empty");
    if (!seen.insert(col.name).second)
      return fail(ErrorKind::InvalidArgument,
                  std::format("duplicate table column '{}'", col.name));
    if (col.data.size() != columns.front().data.size())
      return fail(ErrorKind::InvalidArgument,
                  std::format("column '{}' has {} rows, column '{}' has {}",
                              col.name, col.data.size(), columns.front().name,
                              columns.front().data.size()));
    if (auto ok = col.data.validate(); !ok)
      return fail(ErrorKind::InvalidArgument,
                  std::format("column '{}': {}", col.name, ok.error().message));
  }
  return Table(std::move(columns));
}

std::vector<std::string> Table::column_names() const {
  std::vector<std::string> names;
  names.reserve(columns_.size());
  for (const auto &col : columns_)
    names.push_back(col.name);
  return names;
}

const Column *Table::find(std::string_view name) const noexcept {
  for (const auto &col : columns_) {
    if (col.name == name)
      return &col;
  }
  return nullptr;
}

bool Table::same_layout(const Table &other) const noexcept {
  if (columns_.size() != other.columns_.size())
    return false;
  for (size_t i = 0; i < columns_.size(); ++i) {
    if (columns_[i].name != other.columns_[i].name ||
        columns_[i].data.type() != other.columns_[i].data.type())
      return false;
  }
  return true;
}

Result<void> Table::append(const Table &other) {
  if (!same_layout(other))
    return fail(ErrorKind::BindingInternal,
                "result batches disagree on column layout");
  for (size_t i = 0; i < columns_.size(); ++i) {
    std::vector<Value> merged = columns_[i].data.items();
    const auto &tail = other.columns_[i].data.items();
    merged.insert(merged.end(), tail.begin(), tail.end());
    columns_[i].data = Array(columns_[i].data.type(), std::move(merged));
  }
  return {};
}

// ===========================================================================
// Formatting
// ===========================================================================

namespace {

constexpr size_t kPreviewItems = 8;

void format_into(std::string &out, const Value &value) {
  switch (value.kind()) {
  case ValueKind::Null:
    out += "null";
    break;
  case ValueKind::Bool:
    out += value.as_bool() ? "true" : "false";
    break;
  case ValueKind::Int:
    out += std::to_string(value.as_int());
    break;
  case ValueKind::Float:
    out += std::format("{}", value.as_float());
    break;
  case ValueKind::Timestamp:
    out += std::format("ts({})", value.as_timestamp().nanos);
    break;
  case ValueKind::Date:
    out += std::format("date({})", value.as_date().days);
    break;
  case ValueKind::Time:
    out += std::format("time({})", value.as_time().millis);
    break;
  case ValueKind::Guid: {
    const auto &b = value.as_guid().bytes;
    out += "guid(";
    for (size_t i = 0; i < b.size(); ++i) {
      if (i == 4 || i == 6 || i == 8 || i == 10)
        out += '-';
      out += std::format("{:02x}", b[i]);
    }
    out += ")";
    break;
  }
  case ValueKind::Symbol:
    out += std::format("`{}", value.as_symbol().name);
    break;
  case ValueKind::String:
    out += std::format("\"{}\"", value.as_string());
    break;
  case ValueKind::Bytes:
    out += std::format("bytes[{}]", value.as_bytes().data.size());
    break;
  case ValueKind::Array: {
    const Array &arr = value.as_array();
    out += std::format("{}[", to_string(arr.type()));
    for (size_t i = 0; i < arr.size() && i < kPreviewItems; ++i) {
      if (i)
        out += ", ";
      format_into(out, arr[i]);
    }
    if (arr.size() > kPreviewItems)
      out += std::format(", ... {} more", arr.size() - kPreviewItems);
    out += "]";
    break;
  }
  case ValueKind::List: {
    const List &list = value.as_list();
    out += "list(";
    for (size_t i = 0; i < list.size() && i < kPreviewItems; ++i) {
      if (i)
        out += ", ";
      format_into(out, list[i]);
    }
    if (list.size() > kPreviewItems)
      out += std::format(", ... {} more", list.size() - kPreviewItems);
    out += ")";
    break;
  }
  case ValueKind::Dict: {
    const Dict &dict = value.as_dict();
    out += "dict(";
    format_into(out, dict.keys());
    out += " -> ";
    format_into(out, dict.values());
    out += ")";
    break;
  }
  case ValueKind::Table: {
    const Table &tbl = value.as_table();
    out += "table{";
    for (size_t i = 0; i < tbl.num_columns(); ++i) {
      if (i)
        out += ", ";
      const Column &col = tbl.columns()[i];
      out += std::format("{}:{}", col.name, to_string(col.data.type()));
    }
    out += std::format("}} rows={}", tbl.num_rows());
    break;
  }
  }
}

} // namespace

std::string format_value(const Value &value) {
  std::string out;
  format_into(out, value);
  return out;
}

} // namespace raybind
