#include "raybind/marshal.hpp"

#include <cfloat>
#include <cmath>
#include <cstring>
#include <format>
#include <limits>
#include <optional>

namespace raybind {

std::string_view to_string(StringEncoding encoding) noexcept {
  switch (encoding) {
  case StringEncoding::LengthPrefixed:
    return "length-prefixed";
  case StringEncoding::NulTerminated:
    return "nul-terminated";
  }
  return "unknown";
}

namespace {

constexpr int8_t atom_tag(ray_type_t type) noexcept {
  return static_cast<int8_t>(-static_cast<int>(type));
}

constexpr int8_t vector_tag(ray_type_t type) noexcept {
  return static_cast<int8_t>(type);
}

ray_type_t native_type(ElementType type) noexcept {
  switch (type) {
  case ElementType::Bool:
    return RAY_TYPE_B8;
  case ElementType::U8:
    return RAY_TYPE_U8;
  case ElementType::I16:
    return RAY_TYPE_I16;
  case ElementType::I32:
    return RAY_TYPE_I32;
  case ElementType::I64:
    return RAY_TYPE_I64;
  case ElementType::F32:
    return RAY_TYPE_F32;
  case ElementType::F64:
    return RAY_TYPE_F64;
  case ElementType::Timestamp:
    return RAY_TYPE_TIMESTAMP;
  case ElementType::Date:
    return RAY_TYPE_DATE;
  case ElementType::Time:
    return RAY_TYPE_TIME;
  case ElementType::Guid:
    return RAY_TYPE_GUID;
  case ElementType::Symbol:
    return RAY_TYPE_SYMBOL;
  case ElementType::Char:
    return RAY_TYPE_C8;
  case ElementType::String:
    return RAY_TYPE_STR;
  case ElementType::Bytes:
    return RAY_TYPE_BYTES;
  }
  return RAY_TYPE_NULL;
}

/// Element type of a vector tag; container tags have none.
std::optional<ElementType> element_type_of(int tag) noexcept {
  switch (tag) {
  case RAY_TYPE_B8:
    return ElementType::Bool;
  case RAY_TYPE_U8:
    return ElementType::U8;
  case RAY_TYPE_I16:
    return ElementType::I16;
  case RAY_TYPE_I32:
    return ElementType::I32;
  case RAY_TYPE_I64:
    return ElementType::I64;
  case RAY_TYPE_F32:
    return ElementType::F32;
  case RAY_TYPE_F64:
    return ElementType::F64;
  case RAY_TYPE_TIMESTAMP:
    return ElementType::Timestamp;
  case RAY_TYPE_DATE:
    return ElementType::Date;
  case RAY_TYPE_TIME:
    return ElementType::Time;
  case RAY_TYPE_GUID:
    return ElementType::Guid;
  case RAY_TYPE_SYMBOL:
    return ElementType::Symbol;
  case RAY_TYPE_C8:
    return ElementType::Char;
  case RAY_TYPE_STR:
    return ElementType::String;
  case RAY_TYPE_BYTES:
    return ElementType::Bytes;
  default:
    return std::nullopt;
  }
}

/// Byte width of a fixed-width element, 0 for variable-width types.
size_t element_width(ElementType type) noexcept {
  switch (type) {
  case ElementType::Bool:
  case ElementType::U8:
  case ElementType::Char:
    return 1;
  case ElementType::I16:
    return 2;
  case ElementType::I32:
  case ElementType::F32:
  case ElementType::Date:
  case ElementType::Time:
    return 4;
  case ElementType::I64:
  case ElementType::F64:
  case ElementType::Timestamp:
    return 8;
  case ElementType::Guid:
    return 16;
  case ElementType::Symbol:
  case ElementType::String:
  case ElementType::Bytes:
    return 0;
  }
  return 0;
}

bool is_var_width(ElementType type) noexcept {
  return element_width(type) == 0;
}

/// Nesting limit for lists and dicts, in both directions.
constexpr int kMaxDepth = 64;

std::unexpected<BindError> malformed(std::string message) {
  return fail(ErrorKind::BindingInternal, std::move(message));
}

/// Well-formed UTF-8: no overlong forms, surrogates or code points past
/// U+10FFFF.
bool valid_utf8(std::string_view text) noexcept {
  static constexpr uint32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
  size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<uint8_t>(text[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }
    size_t len;
    uint32_t cp;
    if ((lead & 0xE0) == 0xC0) {
      len = 2;
      cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      len = 3;
      cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      len = 4;
      cp = lead & 0x07;
    } else {
      return false;
    }
    if (text.size() - i < len)
      return false;
    for (size_t k = 1; k < len; ++k) {
      const auto cont = static_cast<uint8_t>(text[i + k]);
      if ((cont & 0xC0) != 0x80)
        return false;
      cp = (cp << 6) | (cont & 0x3F);
    }
    if (cp < kMinForLength[len] || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF))
      return false;
    i += len;
  }
  return true;
}

bool is_text(ElementType type) noexcept {
  return type == ElementType::String || type == ElementType::Symbol;
}

/// Every descriptor in a tree, nested ones included, must zero `reserved`.
Result<void> check_reserved(const ray_value_t &v) {
  for (uint8_t b : v.reserved) {
    if (b != 0)
      return malformed(std::format(
          "descriptor with type tag {} has non-zero reserved bytes",
          static_cast<int>(v.type)));
  }
  return {};
}

template <typename T> void store(uint8_t *dst, T value) noexcept {
  std::memcpy(dst, &value, sizeof(T));
}

template <typename T> T load(const uint8_t *src) noexcept {
  T value;
  std::memcpy(&value, src, sizeof(T));
  return value;
}

template <typename T>
Result<T> narrow_int(int64_t value, ElementType type, size_t index) {
  if (value < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
      value > static_cast<int64_t>(std::numeric_limits<T>::max()))
    return fail(ErrorKind::InvalidArgument,
                std::format("value {} at index {} overflows {}", value, index,
                            to_string(type)));
  return static_cast<T>(value);
}

Result<float> narrow_float(double value, size_t index) {
  // Infinities and NaN have f32 representations; finite values must be exact.
  if (!std::isfinite(value))
    return static_cast<float>(value);
  if (std::fabs(value) > static_cast<double>(FLT_MAX))
    return fail(ErrorKind::InvalidArgument,
                std::format("value {} at index {} overflows f32", value,
                            index));
  const auto narrowed = static_cast<float>(value);
  if (static_cast<double>(narrowed) != value)
    return fail(ErrorKind::InvalidArgument,
                std::format("value {} at index {} is not exactly "
                            "representable in f32",
                            value, index));
  return narrowed;
}

// ===========================================================================
// Variable-width element reader
// ===========================================================================

class VarReader {
public:
  VarReader(const void *data, size_t size, uint8_t encoding) noexcept
      : data_(static_cast<const uint8_t *>(data)), size_(size),
        encoding_(encoding) {}

  Result<std::string> next(size_t index) {
    const size_t left = size_ - pos_;
    if (encoding_ == RAY_STR_LENGTH_PREFIXED) {
      if (left < 4)
        return malformed(
            std::format("truncated length prefix at element {}", index));
      const uint8_t *p = data_ + pos_;
      const uint32_t len = static_cast<uint32_t>(p[0]) |
                           (static_cast<uint32_t>(p[1]) << 8) |
                           (static_cast<uint32_t>(p[2]) << 16) |
                           (static_cast<uint32_t>(p[3]) << 24);
      if (left - 4 < len)
        return malformed(std::format(
            "element {} declares {} bytes, {} remain", index, len, left - 4));
      std::string out(reinterpret_cast<const char *>(p + 4), len);
      pos_ += 4 + len;
      return out;
    }
    const void *nul = left ? std::memchr(data_ + pos_, '\0', left) : nullptr;
    if (!nul)
      return malformed(
          std::format("missing NUL terminator at element {}", index));
    const size_t len = static_cast<const uint8_t *>(nul) - (data_ + pos_);
    std::string out(reinterpret_cast<const char *>(data_ + pos_), len);
    pos_ += len + 1;
    return out;
  }

private:
  const uint8_t *data_;
  size_t size_;
  size_t pos_ = 0;
  uint8_t encoding_;
};

Result<void> check_encoding(uint8_t encoding) {
  if (encoding != RAY_STR_LENGTH_PREFIXED &&
      encoding != RAY_STR_NUL_TERMINATED)
    return malformed(std::format("unknown string encoding tag {}",
                                 static_cast<int>(encoding)));
  return {};
}

Result<Value> make_var(ElementType type, std::string bytes, size_t index) {
  if (is_text(type) && !valid_utf8(bytes))
    return malformed(std::format("{} element {} is not valid UTF-8",
                                 to_string(type), index));
  if (type == ElementType::String)
    return Value::string(std::move(bytes));
  if (type == ElementType::Symbol)
    return Value::symbol(Symbol{std::move(bytes)});
  return Value::bytes(Bytes{std::move(bytes)});
}

Guid load_guid(const uint8_t *src) noexcept {
  Guid g;
  std::memcpy(g.bytes.data(), src, g.bytes.size());
  return g;
}

Result<Value> decode_time(int32_t millis, size_t index) {
  Time t{millis};
  if (!t.valid())
    return malformed(std::format("time element {} holds {} ms, outside one day",
                                 index, millis));
  return Value::time(t);
}

// ===========================================================================
// Decoding
// ===========================================================================

Result<Value> decode_fixed(ElementType type, const uint8_t *p, size_t index) {
  switch (type) {
  case ElementType::Bool: {
    uint8_t b = *p;
    if (b > 1)
      return malformed(
          std::format("bool element {} holds {}", index, static_cast<int>(b)));
    return Value::boolean(b == 1);
  }
  case ElementType::U8:
    return Value::integer(*p);
  case ElementType::I16:
    return Value::integer(load<int16_t>(p));
  case ElementType::I32:
    return Value::integer(load<int32_t>(p));
  case ElementType::I64:
    return Value::integer(load<int64_t>(p));
  case ElementType::F32:
    return Value::floating(load<float>(p));
  case ElementType::F64:
    return Value::floating(load<double>(p));
  case ElementType::Timestamp:
    return Value::timestamp(Timestamp{load<int64_t>(p)});
  case ElementType::Date:
    return Value::date(Date{load<int32_t>(p)});
  case ElementType::Time:
    return decode_time(load<int32_t>(p), index);
  case ElementType::Guid:
    return Value::guid(load_guid(p));
  case ElementType::Char:
    return Value::string(std::string(1, static_cast<char>(*p)));
  default:
    return malformed(std::format("{} is not a fixed-width type",
                                 to_string(type)));
  }
}

Result<Array> decode_vector(const ray_value_t &v) {
  if (auto ok = check_reserved(v); !ok)
    return std::unexpected(std::move(ok).error());
  auto type = element_type_of(v.type);
  if (!type)
    return malformed(std::format("unknown native vector type tag {}",
                                 static_cast<int>(v.type)));
  if (v.len < 0)
    return malformed(std::format("{} vector has negative length {}",
                                 to_string(*type), v.len));
  const size_t n = static_cast<size_t>(v.len);
  if (n == 0)
    return Array(*type);
  if (!v.data)
    return malformed(std::format("{} vector of {} elements has no data",
                                 to_string(*type), n));

  const auto *data = static_cast<const uint8_t *>(v.data);
  const size_t width = element_width(*type);
  // Every element occupies at least one byte in both layouts.
  if (width ? v.data_bytes / width < n : v.data_bytes < n)
    return malformed(std::format("{} vector of {} elements has only {} bytes",
                                 to_string(*type), n, v.data_bytes));
  if (width == 0) {
    if (auto ok = check_encoding(v.encoding); !ok)
      return std::unexpected(std::move(ok).error());
  }

  std::vector<Value> items;
  items.reserve(n);
  VarReader reader(v.data, v.data_bytes, v.encoding);
  for (size_t i = 0; i < n; ++i) {
    const bool valid = !v.validity || ((v.validity[i / 8] >> (i % 8)) & 1u);
    if (width == 0) {
      auto bytes = reader.next(i);
      if (!bytes)
        return std::unexpected(std::move(bytes).error());
      if (!valid) {
        items.push_back(Value::null());
        continue;
      }
      auto item = make_var(*type, std::move(*bytes), i);
      if (!item)
        return std::unexpected(std::move(item).error());
      items.push_back(std::move(*item));
      continue;
    }
    if (!valid) {
      items.push_back(Value::null());
      continue;
    }
    auto item = decode_fixed(*type, data + i * width, i);
    if (!item)
      return std::unexpected(std::move(item).error());
    items.push_back(std::move(*item));
  }
  return Array(*type, std::move(items));
}

Result<Value> decode_atom(const ray_value_t &v) {
  if (auto ok = check_reserved(v); !ok)
    return std::unexpected(std::move(ok).error());
  const int tag = -static_cast<int>(v.type);
  switch (tag) {
  case RAY_TYPE_B8:
    if (v.atom.b8 > 1)
      return malformed(std::format("bool atom holds {}",
                                   static_cast<int>(v.atom.b8)));
    return Value::boolean(v.atom.b8 == 1);
  case RAY_TYPE_U8:
    return Value::integer(v.atom.u8);
  case RAY_TYPE_I16:
    return Value::integer(v.atom.i16);
  case RAY_TYPE_I32:
    return Value::integer(v.atom.i32);
  case RAY_TYPE_I64:
    return Value::integer(v.atom.i64);
  case RAY_TYPE_F32:
    return Value::floating(v.atom.f32);
  case RAY_TYPE_F64:
    return Value::floating(v.atom.f64);
  case RAY_TYPE_TIMESTAMP:
    return Value::timestamp(Timestamp{v.atom.i64});
  case RAY_TYPE_DATE:
    return Value::date(Date{v.atom.date});
  case RAY_TYPE_TIME:
    return decode_time(v.atom.time, 0);
  case RAY_TYPE_GUID:
    return Value::guid(load_guid(v.atom.guid));
  case RAY_TYPE_C8:
    return Value::string(std::string(1, v.atom.c8));
  case RAY_TYPE_STR:
  case RAY_TYPE_SYMBOL:
  case RAY_TYPE_BYTES: {
    if (auto ok = check_encoding(v.encoding); !ok)
      return std::unexpected(std::move(ok).error());
    if (!v.data)
      return malformed("string atom has no data");
    VarReader reader(v.data, v.data_bytes, v.encoding);
    auto bytes = reader.next(0);
    if (!bytes)
      return std::unexpected(std::move(bytes).error());
    return make_var(*element_type_of(tag), std::move(*bytes), 0);
  }
  default:
    return malformed(std::format("unknown native atom type tag {}",
                                 static_cast<int>(v.type)));
  }
}

Result<Value> decode_value(const ray_value_t &v, int depth);
Result<Table> decode_table(const ray_value_t &v);

Result<Value> decode_list(const ray_value_t &v, int depth) {
  if (v.len < 0)
    return malformed(std::format("list has negative length {}", v.len));
  const size_t n = static_cast<size_t>(v.len);
  if (n > 0 && !v.children)
    return malformed(std::format("list of {} items has no children", n));
  std::vector<Value> items;
  items.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    auto item = decode_value(v.children[i], depth + 1);
    if (!item) {
      BindError err = std::move(item).error();
      err.message = std::format("list item {}: {}", i, err.message);
      return std::unexpected(std::move(err));
    }
    items.push_back(std::move(*item));
  }
  return Value::list(List(std::move(items)));
}

Result<Value> decode_dict(const ray_value_t &v, int depth) {
  if (v.len < 0)
    return malformed(std::format("dict has negative length {}", v.len));
  if (!v.children)
    return malformed("dict descriptor has no keys or values");
  Value halves[2];
  for (size_t i = 0; i < 2; ++i) {
    const ray_value_t &half = v.children[i];
    const char *what = i == 0 ? "keys" : "values";
    if (half.type != RAY_TYPE_LIST && !(half.type > 0 && element_type_of(half.type)))
      return malformed(std::format("dict {} are not a vector or list (tag {})",
                                   what, static_cast<int>(half.type)));
    auto decoded = decode_value(half, depth + 1);
    if (!decoded) {
      BindError err = std::move(decoded).error();
      err.message = std::format("dict {}: {}", what, err.message);
      return std::unexpected(std::move(err));
    }
    if (sequence_size(*decoded) != static_cast<size_t>(v.len))
      return malformed(std::format("dict declares {} entries, its {} hold {}",
                                   v.len, what, *sequence_size(*decoded)));
    halves[i] = std::move(*decoded);
  }
  auto dict = Dict::make(std::move(halves[0]), std::move(halves[1]));
  if (!dict)
    return malformed(std::format("engine returned an invalid dict: {}",
                                 dict.error().message));
  return Value::dict(std::move(*dict));
}

Result<Value> decode_value(const ray_value_t &v, int depth) {
  if (depth > kMaxDepth)
    return malformed(std::format("value nests deeper than {} levels",
                                 kMaxDepth));
  if (auto ok = check_reserved(v); !ok)
    return std::unexpected(std::move(ok).error());
  if (v.type == RAY_TYPE_NULL) {
    if (v.len != 0 || v.data != nullptr)
      return malformed("null descriptor is shaped like a vector");
    return Value::null();
  }
  if (v.type < 0)
    return decode_atom(v);
  switch (v.type) {
  case RAY_TYPE_LIST:
    return decode_list(v, depth);
  case RAY_TYPE_DICT:
    return decode_dict(v, depth);
  case RAY_TYPE_TABLE: {
    auto table = decode_table(v);
    if (!table)
      return std::unexpected(std::move(table).error());
    return Value::table(std::move(*table));
  }
  default: {
    auto arr = decode_vector(v);
    if (!arr)
      return std::unexpected(std::move(arr).error());
    return Value::array(std::move(*arr));
  }
  }
}

Result<Table> decode_table(const ray_value_t &v) {
  if (auto ok = check_reserved(v); !ok)
    return std::unexpected(std::move(ok).error());
  if (v.type != RAY_TYPE_TABLE)
    return malformed(std::format("expected a table descriptor, got type tag {}",
                                 static_cast<int>(v.type)));
  if (v.len < 0)
    return malformed(std::format("table has negative column count {}", v.len));
  const size_t ncols = static_cast<size_t>(v.len);
  if (ncols > 0 && (!v.names || !v.children))
    return malformed("table descriptor is missing names or columns");

  std::vector<Column> columns;
  columns.reserve(ncols);
  for (size_t i = 0; i < ncols; ++i) {
    if (!v.names[i])
      return malformed(std::format("table column {} has no name", i));
    std::string name(v.names[i]);
    const ray_value_t &col = v.children[i];
    if (col.type <= 0 || !element_type_of(col.type))
      return malformed(std::format("table column '{}' is not a vector (tag {})",
                                   name, static_cast<int>(col.type)));
    auto data = decode_vector(col);
    if (!data) {
      BindError err = std::move(data).error();
      err.message = std::format("column '{}': {}", name, err.message);
      return std::unexpected(std::move(err));
    }
    if (!columns.empty() && data->size() != columns.front().data.size())
      return malformed(std::format(
          "table column '{}' has {} rows, column '{}' has {}", name,
          data->size(), columns.front().name, columns.front().data.size()));
    columns.push_back(Column{std::move(name), std::move(*data)});
  }

  auto table = Table::make(std::move(columns));
  if (!table)
    return malformed(std::format("engine returned an invalid table: {}",
                                 table.error().message));
  return table;
}

} // namespace

// ===========================================================================
// Encoding
// ===========================================================================

namespace detail {

class NativeBuilder {
public:
  NativeBuilder(NativeValue &out, StringEncoding encoding) noexcept
      : out_(out), encoding_(encoding) {}

  /// Zero-initialized, address-stable descriptor slots.
  ray_value_t *nodes(size_t count) {
    return out_.nodes_.emplace_back(count).data();
  }

  void set_root_count(size_t count) noexcept { out_.root_count_ = count; }

  Result<void> encode(const Value &value, ray_value_t &slot, int depth = 0) {
    if (depth > kMaxDepth)
      return fail(ErrorKind::InvalidArgument,
                  std::format("value nests deeper than {} levels", kMaxDepth));
    switch (value.kind()) {
    case ValueKind::Null:
      slot.type = RAY_TYPE_NULL;
      return {};
    case ValueKind::Bool:
      slot.type = atom_tag(RAY_TYPE_B8);
      slot.atom.b8 = value.as_bool() ? 1 : 0;
      return {};
    case ValueKind::Int:
      slot.type = atom_tag(RAY_TYPE_I64);
      slot.atom.i64 = value.as_int();
      return {};
    case ValueKind::Float:
      slot.type = atom_tag(RAY_TYPE_F64);
      slot.atom.f64 = value.as_float();
      return {};
    case ValueKind::Timestamp:
      slot.type = atom_tag(RAY_TYPE_TIMESTAMP);
      slot.atom.i64 = value.as_timestamp().nanos;
      return {};
    case ValueKind::Date:
      slot.type = atom_tag(RAY_TYPE_DATE);
      slot.atom.date = value.as_date().days;
      return {};
    case ValueKind::Time:
      if (auto ok = check_time(value.as_time(), 0); !ok)
        return ok;
      slot.type = atom_tag(RAY_TYPE_TIME);
      slot.atom.time = value.as_time().millis;
      return {};
    case ValueKind::Guid:
      slot.type = atom_tag(RAY_TYPE_GUID);
      std::memcpy(slot.atom.guid, value.as_guid().bytes.data(),
                  sizeof(slot.atom.guid));
      return {};
    case ValueKind::Symbol:
      return encode_var_atom(RAY_TYPE_SYMBOL, value.as_symbol().name, slot);
    case ValueKind::String:
      return encode_var_atom(RAY_TYPE_STR, value.as_string(), slot);
    case ValueKind::Bytes:
      return encode_var_atom(RAY_TYPE_BYTES, value.as_bytes().data, slot);
    case ValueKind::Array:
      return encode_array(value.as_array(), slot);
    case ValueKind::List:
      return encode_list(value.as_list(), slot, depth);
    case ValueKind::Dict:
      return encode_dict(value.as_dict(), slot, depth);
    case ValueKind::Table:
      return encode_table(value.as_table(), slot);
    }
    return malformed("unhandled value kind");
  }

private:
  const uint8_t *publish(std::vector<uint8_t> bytes) {
    out_.buffer_bytes_ += bytes.size();
    return out_.buffers_.emplace_back(std::move(bytes)).data();
  }

  Result<void> append_var(std::vector<uint8_t> &buf, std::string_view bytes,
                          size_t index) {
    if (encoding_ == StringEncoding::LengthPrefixed) {
      if (bytes.size() > std::numeric_limits<uint32_t>::max())
        return fail(ErrorKind::InvalidArgument,
                    std::format("element {} is {} bytes, the limit is 4 GiB",
                                index, bytes.size()));
      const auto len = static_cast<uint32_t>(bytes.size());
      for (int shift = 0; shift < 32; shift += 8)
        buf.push_back(static_cast<uint8_t>(len >> shift));
      buf.insert(buf.end(), bytes.begin(), bytes.end());
      return {};
    }
    if (bytes.find('\0') != std::string_view::npos)
      return fail(ErrorKind::InvalidArgument,
                  std::format("element {} contains an embedded NUL, which "
                              "nul-terminated encoding cannot carry",
                              index));
    buf.insert(buf.end(), bytes.begin(), bytes.end());
    buf.push_back(0);
    return {};
  }

  static Result<void> check_text(std::string_view text, size_t index) {
    if (!valid_utf8(text))
      return fail(ErrorKind::InvalidArgument,
                  std::format("element {} is not valid UTF-8", index));
    return {};
  }

  static Result<void> check_time(Time t, size_t index) {
    if (!t.valid())
      return fail(ErrorKind::InvalidArgument,
                  std::format("time {} ms at index {} is outside one day",
                              t.millis, index));
    return {};
  }

  Result<void> encode_var_atom(ray_type_t type, std::string_view bytes,
                               ray_value_t &slot) {
    if (type != RAY_TYPE_BYTES) {
      if (auto ok = check_text(bytes, 0); !ok)
        return ok;
    }
    std::vector<uint8_t> buf;
    buf.reserve(bytes.size() + 4);
    if (auto ok = append_var(buf, bytes, 0); !ok)
      return ok;
    slot.type = atom_tag(type);
    slot.encoding = static_cast<uint8_t>(encoding_);
    slot.len = 1;
    slot.data_bytes = buf.size();
    slot.data = publish(std::move(buf));
    return {};
  }

  Result<void> encode_fixed(ElementType type, const Value &item, size_t index,
                            uint8_t *dst) {
    switch (type) {
    case ElementType::Bool:
      *dst = item.as_bool() ? 1 : 0;
      return {};
    case ElementType::U8: {
      auto v = narrow_int<uint8_t>(item.as_int(), type, index);
      if (!v)
        return std::unexpected(std::move(v).error());
      *dst = *v;
      return {};
    }
    case ElementType::I16: {
      auto v = narrow_int<int16_t>(item.as_int(), type, index);
      if (!v)
        return std::unexpected(std::move(v).error());
      store(dst, *v);
      return {};
    }
    case ElementType::I32: {
      auto v = narrow_int<int32_t>(item.as_int(), type, index);
      if (!v)
        return std::unexpected(std::move(v).error());
      store(dst, *v);
      return {};
    }
    case ElementType::I64:
      store(dst, item.as_int());
      return {};
    case ElementType::F32: {
      auto v = narrow_float(item.as_float(), index);
      if (!v)
        return std::unexpected(std::move(v).error());
      store(dst, *v);
      return {};
    }
    case ElementType::F64:
      store(dst, item.as_float());
      return {};
    case ElementType::Timestamp:
      store(dst, item.as_timestamp().nanos);
      return {};
    case ElementType::Date:
      store(dst, item.as_date().days);
      return {};
    case ElementType::Time:
      if (auto ok = check_time(item.as_time(), index); !ok)
        return ok;
      store(dst, item.as_time().millis);
      return {};
    case ElementType::Guid:
      std::memcpy(dst, item.as_guid().bytes.data(), item.as_guid().bytes.size());
      return {};
    case ElementType::Char:
      *dst = static_cast<uint8_t>(item.as_string().front());
      return {};
    default:
      return malformed(std::format("{} is not a fixed-width type",
                                   to_string(type)));
    }
  }

  Result<void> encode_array(const Array &arr, ray_value_t &slot) {
    if (auto ok = arr.validate(); !ok)
      return ok;

    const ElementType type = arr.type();
    const size_t n = arr.size();
    slot.type = vector_tag(native_type(type));
    slot.len = static_cast<int64_t>(n);

    bool has_null = false;
    for (const auto &item : arr.items())
      has_null = has_null || item.is_null();
    if (has_null) {
      std::vector<uint8_t> bits((n + 7) / 8, 0);
      for (size_t i = 0; i < n; ++i) {
        if (!arr[i].is_null())
          bits[i / 8] |= static_cast<uint8_t>(1u << (i % 8));
      }
      slot.validity = publish(std::move(bits));
    }

    std::vector<uint8_t> buf;
    if (is_var_width(type)) {
      slot.encoding = static_cast<uint8_t>(encoding_);
      for (size_t i = 0; i < n; ++i) {
        const Value &item = arr[i];
        std::string_view bytes;
        if (!item.is_null()) {
          bytes = var_bytes(type, item);
          if (is_text(type)) {
            if (auto ok = check_text(bytes, i); !ok)
              return ok;
          }
        }
        if (auto ok = append_var(buf, bytes, i); !ok)
          return ok;
      }
    } else {
      const size_t width = element_width(type);
      buf.assign(n * width, 0);
      for (size_t i = 0; i < n; ++i) {
        if (arr[i].is_null())
          continue;
        if (auto ok = encode_fixed(type, arr[i], i, buf.data() + i * width); !ok)
          return ok;
      }
    }
    slot.data_bytes = buf.size();
    if (!buf.empty())
      slot.data = publish(std::move(buf));
    return {};
  }

  static std::string_view var_bytes(ElementType type, const Value &item) {
    switch (type) {
    case ElementType::Symbol:
      return item.as_symbol().name;
    case ElementType::Bytes:
      return item.as_bytes().data;
    default:
      return item.as_string();
    }
  }

  Result<void> encode_list(const List &list, ray_value_t &slot, int depth) {
    const size_t n = list.size();
    slot.type = vector_tag(RAY_TYPE_LIST);
    slot.len = static_cast<int64_t>(n);
    if (n == 0)
      return {};
    ray_value_t *items = nodes(n);
    for (size_t i = 0; i < n; ++i) {
      if (auto ok = encode(list[i], items[i], depth + 1); !ok) {
        BindError err = std::move(ok).error();
        err.message = std::format("list item {}: {}", i, err.message);
        return std::unexpected(std::move(err));
      }
    }
    slot.children = items;
    return {};
  }

  Result<void> encode_dict(const Dict &dict, ray_value_t &slot, int depth) {
    slot.type = vector_tag(RAY_TYPE_DICT);
    slot.len = static_cast<int64_t>(dict.size());
    ray_value_t *halves = nodes(2);
    if (auto ok = encode(dict.keys(), halves[0], depth + 1); !ok) {
      BindError err = std::move(ok).error();
      err.message = std::format("dict keys: {}", err.message);
      return std::unexpected(std::move(err));
    }
    if (auto ok = encode(dict.values(), halves[1], depth + 1); !ok) {
      BindError err = std::move(ok).error();
      err.message = std::format("dict values: {}", err.message);
      return std::unexpected(std::move(err));
    }
    slot.children = halves;
    return {};
  }

  Result<void> encode_table(const Table &table, ray_value_t &slot) {
    const size_t ncols = table.num_columns();
    slot.type = vector_tag(RAY_TYPE_TABLE);
    slot.len = static_cast<int64_t>(ncols);
    if (ncols == 0)
      return {};

    ray_value_t *cols = nodes(ncols);
    auto &names = out_.name_tables_.emplace_back(ncols, nullptr);
    const char **name_slots = names.data();
    for (size_t i = 0; i < ncols; ++i) {
      const Column &col = table.columns()[i];
      if (col.name.find('\0') != std::string::npos)
        return fail(ErrorKind::InvalidArgument,
                    std::format("column name '{}' contains a NUL byte",
                                col.name));
      std::vector<uint8_t> name(col.name.begin(), col.name.end());
      name.push_back(0);
      name_slots[i] = reinterpret_cast<const char *>(publish(std::move(name)));
      if (auto ok = encode_array(col.data, cols[i]); !ok) {
        BindError err = std::move(ok).error();
        err.message = std::format("column '{}': {}", col.name, err.message);
        return std::unexpected(std::move(err));
      }
    }
    slot.names = name_slots;
    slot.children = cols;
    return {};
  }

  NativeValue &out_;
  StringEncoding encoding_;
};

} // namespace detail

Result<NativeValue> to_native(const Value &value, StringEncoding encoding) {
  return to_native(std::span<const Value>(&value, 1), encoding);
}

Result<NativeValue> to_native(std::span<const Value> values,
                              StringEncoding encoding) {
  NativeValue out;
  detail::NativeBuilder builder(out, encoding);
  ray_value_t *roots = builder.nodes(values.size());
  for (size_t i = 0; i < values.size(); ++i) {
    if (auto ok = builder.encode(values[i], roots[i]); !ok) {
      BindError err = std::move(ok).error();
      if (values.size() > 1)
        err.message = std::format("parameter {}: {}", i, err.message);
      return std::unexpected(std::move(err));
    }
  }
  builder.set_root_count(values.size());
  return out;
}

Result<Value> from_native(const ray_value_t *value) {
  if (!value)
    return malformed("engine returned a null descriptor");
  return decode_value(*value, 0);
}

Result<Table> table_from_native(const ray_value_t *value) {
  if (!value)
    return malformed("engine returned a null table descriptor");
  return decode_table(*value);
}

} // namespace raybind
