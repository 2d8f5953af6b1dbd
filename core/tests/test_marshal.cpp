#include "raybind/marshal.hpp"
#include <cmath>
#include <cstring>
#include <gtest/gtest.h>
#include <iterator>
#include <limits>

using namespace raybind;

namespace {

Array ints(ElementType type, std::initializer_list<int64_t> values) {
  std::vector<Value> items;
  for (auto v : values)
    items.push_back(Value::integer(v));
  return Array(type, std::move(items));
}

Table sample_table() {
  auto t = Table::make(
      {{"id", ints(ElementType::I64, {1, 2, 3})},
       {"name", Array(ElementType::String,
                      {Value::string("a"), Value::null(), Value::string("c")})},
       {"score", Array(ElementType::F32, {Value::floating(0.5), Value::null(),
                                          Value::floating(-2.0)})}});
  return unwrap(std::move(t));
}

/// Length-prefixed payload for `parts`.
std::vector<uint8_t> prefixed(std::initializer_list<std::string_view> parts) {
  std::vector<uint8_t> out;
  for (auto p : parts) {
    auto len = static_cast<uint32_t>(p.size());
    for (int shift = 0; shift < 32; shift += 8)
      out.push_back(static_cast<uint8_t>(len >> shift));
    out.insert(out.end(), p.begin(), p.end());
  }
  return out;
}

ray_value_t vector_of(ray_type_t type, int64_t len, const void *data,
                      size_t bytes) {
  ray_value_t v{};
  v.type = static_cast<int8_t>(type);
  v.len = len;
  v.data = data;
  v.data_bytes = bytes;
  return v;
}

} // namespace

// ============================================================================
// Encoding
// ============================================================================

TEST(Marshal, ScalarAtoms) {
  auto n = to_native(Value::integer(-5));
  ASSERT_TRUE(n.has_value());
  ASSERT_EQ(n->size(), 1u);
  EXPECT_EQ(n->get()->type, -RAY_TYPE_I64);
  EXPECT_EQ(n->get()->atom.i64, -5);

  auto f = to_native(Value::floating(2.25));
  ASSERT_TRUE(f.has_value());
  EXPECT_EQ(f->get()->type, -RAY_TYPE_F64);
  EXPECT_EQ(f->get()->atom.f64, 2.25);

  auto b = to_native(Value::boolean(true));
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(b->get()->type, -RAY_TYPE_B8);
  EXPECT_EQ(b->get()->atom.b8, 1);

  auto null = to_native(Value());
  ASSERT_TRUE(null.has_value());
  EXPECT_EQ(null->get()->type, RAY_TYPE_NULL);
  EXPECT_EQ(null->get()->data, nullptr);
}

TEST(Marshal, StringAtomLengthPrefixed) {
  auto n = to_native(Value::string("abc"));
  ASSERT_TRUE(n.has_value());
  const ray_value_t &v = *n->get();
  EXPECT_EQ(v.type, -RAY_TYPE_STR);
  EXPECT_EQ(v.encoding, RAY_STR_LENGTH_PREFIXED);
  ASSERT_EQ(v.data_bytes, 7u);
  const auto *p = static_cast<const uint8_t *>(v.data);
  EXPECT_EQ(p[0], 3);
  EXPECT_EQ(p[1], 0);
  EXPECT_EQ(std::memcmp(p + 4, "abc", 3), 0);
  EXPECT_EQ(n->buffer_bytes(), 7u);
}

TEST(Marshal, StringAtomNulTerminated) {
  auto n = to_native(Value::string("abc"), StringEncoding::NulTerminated);
  ASSERT_TRUE(n.has_value());
  const ray_value_t &v = *n->get();
  EXPECT_EQ(v.encoding, RAY_STR_NUL_TERMINATED);
  ASSERT_EQ(v.data_bytes, 4u);
  EXPECT_STREQ(static_cast<const char *>(v.data), "abc");
}

TEST(Marshal, EmbeddedNulNeedsLengthPrefix) {
  Value v = Value::bytes(Bytes{std::string("a\0b", 3)});

  auto nul = to_native(v, StringEncoding::NulTerminated);
  ASSERT_FALSE(nul.has_value());
  EXPECT_EQ(nul.error().kind, ErrorKind::InvalidArgument);

  auto lp = to_native(v, StringEncoding::LengthPrefixed);
  ASSERT_TRUE(lp.has_value());
  auto back = from_native(lp->get());
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, v);
}

TEST(Marshal, NarrowingOverflowIsInvalidArgument) {
  auto i32 = to_native(Value::array(
      ints(ElementType::I32, {1, int64_t{std::numeric_limits<int32_t>::max()} + 1})));
  ASSERT_FALSE(i32.has_value());
  EXPECT_EQ(i32.error().kind, ErrorKind::InvalidArgument);
  EXPECT_EQ(i32.error().message, "value 2147483648 at index 1 overflows i32");

  auto u8 = to_native(Value::array(ints(ElementType::U8, {-1})));
  ASSERT_FALSE(u8.has_value());
  EXPECT_EQ(u8.error().kind, ErrorKind::InvalidArgument);

  auto i16 = to_native(Value::array(ints(ElementType::I16, {-32768, 32767})));
  EXPECT_TRUE(i16.has_value());
}

TEST(Marshal, F32RangeCheck) {
  auto big = to_native(
      Value::array(Array(ElementType::F32, {Value::floating(1e300)})));
  ASSERT_FALSE(big.has_value());
  EXPECT_EQ(big.error().kind, ErrorKind::InvalidArgument);
  EXPECT_EQ(big.error().message, "value 1e+300 at index 0 overflows f32");

  auto special = to_native(Value::array(Array(
      ElementType::F32, {Value::floating(std::numeric_limits<double>::infinity()),
                         Value::floating(std::nan("")), Value::floating(0.25)})));
  EXPECT_TRUE(special.has_value());
}

TEST(Marshal, F32RejectsPrecisionLoss) {
  auto lossy = to_native(Value::array(
      Array(ElementType::F32, {Value::floating(0.5), Value::floating(0.1)})));
  ASSERT_FALSE(lossy.has_value());
  EXPECT_EQ(lossy.error().kind, ErrorKind::InvalidArgument);
  EXPECT_EQ(lossy.error().message,
            "value 0.1 at index 1 is not exactly representable in f32");
}

TEST(Marshal, F32ArraysFromMakeRoundTrip) {
  Array arr = unwrap(Array::make(
      ElementType::F32, {Value::floating(0.1), Value::null(), Value::floating(-3.3)}));
  EXPECT_EQ(arr[0], Value::floating(static_cast<double>(0.1f)));
  auto n = to_native(Value::array(arr));
  ASSERT_TRUE(n.has_value());
  auto back = from_native(n->get());
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(back->as_array(), arr);
}

TEST(Marshal, TemporalAndGuidAtoms) {
  auto date = to_native(Value::date(Date{-1}));
  ASSERT_TRUE(date.has_value());
  EXPECT_EQ(date->get()->type, -RAY_TYPE_DATE);
  EXPECT_EQ(date->get()->atom.date, -1);

  auto time = to_native(Value::time(Time{Time::kMillisPerDay - 1}));
  ASSERT_TRUE(time.has_value());
  EXPECT_EQ(time->get()->type, -RAY_TYPE_TIME);
  EXPECT_EQ(time->get()->atom.time, Time::kMillisPerDay - 1);

  Guid g;
  for (size_t i = 0; i < g.bytes.size(); ++i)
    g.bytes[i] = static_cast<uint8_t>(i * 17);
  auto guid = to_native(Value::guid(g));
  ASSERT_TRUE(guid.has_value());
  EXPECT_EQ(guid->get()->type, -RAY_TYPE_GUID);
  EXPECT_EQ(std::memcmp(guid->get()->atom.guid, g.bytes.data(), 16), 0);
}

TEST(Marshal, TimeOutsideOneDayIsInvalidArgument) {
  auto atom = to_native(Value::time(Time{Time::kMillisPerDay}));
  ASSERT_FALSE(atom.has_value());
  EXPECT_EQ(atom.error().kind, ErrorKind::InvalidArgument);

  auto vec = to_native(Value::array(
      Array(ElementType::Time, {Value::time(Time{0}), Value::time(Time{-5})})));
  ASSERT_FALSE(vec.has_value());
  EXPECT_EQ(vec.error().message, "time -5 ms at index 1 is outside one day");
}

TEST(Marshal, SymbolAtomIsTaggedApartFromString) {
  auto n = to_native(Value::symbol(Symbol{"px"}));
  ASSERT_TRUE(n.has_value());
  EXPECT_EQ(n->get()->type, -RAY_TYPE_SYMBOL);
  EXPECT_EQ(n->get()->encoding, RAY_STR_LENGTH_PREFIXED);
  auto back = from_native(n->get());
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, Value::symbol(Symbol{"px"}));
  EXPECT_NE(*back, Value::string("px"));
}

TEST(Marshal, CharVectorIsOneBytePerElement) {
  Array arr = unwrap(Array::make(
      ElementType::Char,
      {Value::string("x"), Value::null(), Value::string("\xff")}));
  auto n = to_native(Value::array(arr));
  ASSERT_TRUE(n.has_value());
  const ray_value_t &v = *n->get();
  EXPECT_EQ(v.type, RAY_TYPE_C8);
  ASSERT_EQ(v.data_bytes, 3u);
  const auto *p = static_cast<const uint8_t *>(v.data);
  EXPECT_EQ(p[0], 'x');
  EXPECT_EQ(p[2], 0xff);
  EXPECT_EQ(v.validity[0], 0b101);
}

TEST(Marshal, InvalidUtf8TextIsInvalidArgument) {
  auto atom = to_native(Value::string("ok\xc3"));
  ASSERT_FALSE(atom.has_value());
  EXPECT_EQ(atom.error().kind, ErrorKind::InvalidArgument);
  EXPECT_EQ(atom.error().message, "element 0 is not valid UTF-8");

  auto sym = to_native(Value::array(Array(
      ElementType::Symbol,
      {Value::symbol(Symbol{"a"}), Value::symbol(Symbol{"\xed\xa0\x80"})})));
  ASSERT_FALSE(sym.has_value());
  EXPECT_EQ(sym.error().message, "element 1 is not valid UTF-8");

  // Bytes carry no text contract.
  EXPECT_TRUE(to_native(Value::bytes(Bytes{"\xc3"})).has_value());
  EXPECT_TRUE(to_native(Value::string("caf\xc3\xa9 \xf0\x9f\x98\x80"))
                  .has_value());
}

TEST(Marshal, ListLayout) {
  Value list = Value::list(
      List({Value::integer(1), Value::string("a"),
            Value::array(ints(ElementType::I32, {4, 5}))}));
  auto n = to_native(list);
  ASSERT_TRUE(n.has_value());
  const ray_value_t &v = *n->get();
  EXPECT_EQ(v.type, RAY_TYPE_LIST);
  ASSERT_EQ(v.len, 3);
  EXPECT_EQ(v.children[0].type, -RAY_TYPE_I64);
  EXPECT_EQ(v.children[1].type, -RAY_TYPE_STR);
  EXPECT_EQ(v.children[2].type, RAY_TYPE_I32);
  EXPECT_EQ(v.children[2].len, 2);

  auto empty = to_native(Value::list(List()));
  ASSERT_TRUE(empty.has_value());
  EXPECT_EQ(empty->get()->len, 0);
  EXPECT_EQ(empty->get()->children, nullptr);
}

TEST(Marshal, DictLayout) {
  Dict d = unwrap(Dict::make(
      Value::array(Array(ElementType::Symbol, {Value::symbol(Symbol{"a"}),
                                               Value::symbol(Symbol{"b"})})),
      Value::list(List({Value::integer(1), Value::string("x")}))));
  auto n = to_native(Value::dict(d));
  ASSERT_TRUE(n.has_value());
  const ray_value_t &v = *n->get();
  EXPECT_EQ(v.type, RAY_TYPE_DICT);
  EXPECT_EQ(v.len, 2);
  EXPECT_EQ(v.children[0].type, RAY_TYPE_SYMBOL);
  EXPECT_EQ(v.children[1].type, RAY_TYPE_LIST);
}

TEST(Marshal, NestedErrorsNameTheirPath) {
  Value bad = Value::list(
      List({Value::integer(1),
            Value::dict(unwrap(Dict::make(
                Value::array(ints(ElementType::U8, {1})),
                Value::array(ints(ElementType::U8, {256})))))}));
  auto n = to_native(bad);
  ASSERT_FALSE(n.has_value());
  EXPECT_EQ(n.error().message,
            "list item 1: dict values: value 256 at index 0 overflows u8");
}

TEST(Marshal, HostNestingIsBounded) {
  Value v = Value::integer(0);
  for (int i = 0; i < 80; ++i)
    v = Value::list(List({v}));
  auto n = to_native(v);
  ASSERT_FALSE(n.has_value());
  EXPECT_EQ(n.error().kind, ErrorKind::InvalidArgument);
  EXPECT_NE(n.error().message.find("nests deeper than 64 levels"),
            std::string::npos);
}

TEST(Marshal, ValidityBitmapOnlyWithNulls) {
  auto dense = to_native(Value::array(ints(ElementType::I64, {1, 2, 3})));
  ASSERT_TRUE(dense.has_value());
  EXPECT_EQ(dense->get()->validity, nullptr);
  EXPECT_EQ(dense->get()->len, 3);
  EXPECT_EQ(dense->get()->data_bytes, 24u);

  auto sparse = to_native(Value::array(Array(
      ElementType::I64, {Value::integer(1), Value::null(), Value::integer(3)})));
  ASSERT_TRUE(sparse.has_value());
  ASSERT_NE(sparse->get()->validity, nullptr);
  EXPECT_EQ(sparse->get()->validity[0], 0b101);
}

TEST(Marshal, EmptyArrayKeepsType) {
  auto n = to_native(Value::array(Array(ElementType::String)));
  ASSERT_TRUE(n.has_value());
  EXPECT_EQ(n->get()->type, RAY_TYPE_STR);
  EXPECT_EQ(n->get()->len, 0);
  EXPECT_EQ(n->get()->data, nullptr);

  auto back = from_native(n->get());
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(back->as_array().type(), ElementType::String);
  EXPECT_TRUE(back->as_array().empty());
}

TEST(Marshal, TableLayout) {
  Table t = sample_table();
  auto n = to_native(Value::table(t));
  ASSERT_TRUE(n.has_value());
  const ray_value_t &v = *n->get();
  EXPECT_EQ(v.type, RAY_TYPE_TABLE);
  ASSERT_EQ(v.len, 3);
  EXPECT_STREQ(v.names[0], "id");
  EXPECT_STREQ(v.names[2], "score");
  EXPECT_EQ(v.children[1].type, RAY_TYPE_STR);
  EXPECT_EQ(v.children[2].type, RAY_TYPE_F32);
  EXPECT_EQ(v.children[2].data_bytes, 12u);

  auto back = table_from_native(n->get());
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, t);
}

TEST(Marshal, TableColumnErrorsNameTheColumn) {
  auto t = Table::make({{"small", ints(ElementType::U8, {300})}});
  ASSERT_TRUE(t.has_value());
  auto n = to_native(Value::table(*t));
  ASSERT_FALSE(n.has_value());
  EXPECT_EQ(n.error().message, "column 'small': value 300 at index 0 overflows u8");
}

TEST(Marshal, ParameterList) {
  std::vector<Value> params = {Value::integer(1), Value::string("x"),
                               Value::array(ints(ElementType::I64, {}))};
  auto n = to_native(std::span<const Value>(params));
  ASSERT_TRUE(n.has_value());
  ASSERT_EQ(n->size(), 3u);
  EXPECT_EQ(n->get()[0].type, -RAY_TYPE_I64);
  EXPECT_EQ(n->get()[1].type, -RAY_TYPE_STR);
  EXPECT_EQ(n->get()[2].type, RAY_TYPE_I64);

  auto none = to_native(std::span<const Value>());
  ASSERT_TRUE(none.has_value());
  EXPECT_TRUE(none->empty());
  EXPECT_EQ(none->get(), nullptr);
}

TEST(Marshal, ParameterErrorsNameTheParameter) {
  std::vector<Value> params = {
      Value::integer(1), Value::array(ints(ElementType::I16, {70000}))};
  auto n = to_native(std::span<const Value>(params));
  ASSERT_FALSE(n.has_value());
  EXPECT_EQ(n.error().message,
            "parameter 1: value 70000 at index 0 overflows i16");
}

TEST(Marshal, BuffersSurviveMove) {
  auto n = to_native(Value::string("persist"));
  ASSERT_TRUE(n.has_value());
  const ray_value_t *root = n->get();
  NativeValue moved = std::move(*n);
  EXPECT_EQ(moved.get(), root);
  auto back = from_native(moved.get());
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(back->as_string(), "persist");
}

// ============================================================================
// Decoding engine-produced descriptors
// ============================================================================

TEST(MarshalDecode, NarrowEngineTypesWidenToInt) {
  const int16_t raw[] = {-2, 7};
  ray_value_t v = vector_of(RAY_TYPE_I16, 2, raw, sizeof(raw));
  auto back = from_native(&v);
  ASSERT_TRUE(back.has_value());
  const Array &arr = back->as_array();
  EXPECT_EQ(arr.type(), ElementType::I16);
  EXPECT_EQ(arr[0], Value::integer(-2));
  EXPECT_EQ(arr[1], Value::integer(7));
}

TEST(MarshalDecode, NullVarWidthElementsKeepTheirSlot) {
  auto payload = prefixed({"a", "", "c"});
  const uint8_t validity = 0b101;
  ray_value_t v = vector_of(RAY_TYPE_STR, 3, payload.data(), payload.size());
  v.encoding = RAY_STR_LENGTH_PREFIXED;
  v.validity = &validity;
  auto back = from_native(&v);
  ASSERT_TRUE(back.has_value());
  const Array &arr = back->as_array();
  EXPECT_EQ(arr[0], Value::string("a"));
  EXPECT_TRUE(arr[1].is_null());
  EXPECT_EQ(arr[2], Value::string("c"));
}

TEST(MarshalDecode, NulTerminatedVector) {
  const char payload[] = "x\0yz\0";
  ray_value_t v = vector_of(RAY_TYPE_STR, 2, payload, sizeof(payload) - 1);
  v.encoding = RAY_STR_NUL_TERMINATED;
  auto back = from_native(&v);
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(back->as_array()[1], Value::string("yz"));
}

TEST(MarshalDecode, MalformedInputIsBindingInternal) {
  auto expect_internal = [](const ray_value_t &v, std::string_view needle) {
    auto r = from_native(&v);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::BindingInternal);
    EXPECT_NE(r.error().message.find(needle), std::string::npos)
        << r.error().message;
  };

  const int64_t one = 1;
  expect_internal(vector_of(static_cast<ray_type_t>(50), 1, &one, 8),
                  "unknown native vector type tag 50");
  expect_internal(vector_of(RAY_TYPE_I64, 2, &one, 8), "has only 8 bytes");
  expect_internal(vector_of(RAY_TYPE_I64, -1, &one, 8), "negative length");
  expect_internal(vector_of(RAY_TYPE_I64, 1, nullptr, 0), "has no data");

  const uint8_t two = 2;
  expect_internal(vector_of(RAY_TYPE_B8, 1, &two, 1), "bool element 0 holds 2");

  auto truncated = prefixed({"abcdef"});
  truncated.resize(6);
  ray_value_t lp = vector_of(RAY_TYPE_STR, 1, truncated.data(), truncated.size());
  lp.encoding = RAY_STR_LENGTH_PREFIXED;
  expect_internal(lp, "element 0 declares 6 bytes, 2 remain");

  const char unterminated[] = {'a', 'b'};
  ray_value_t nt = vector_of(RAY_TYPE_STR, 1, unterminated, 2);
  nt.encoding = RAY_STR_NUL_TERMINATED;
  expect_internal(nt, "missing NUL terminator at element 0");

  ray_value_t bad_enc = vector_of(RAY_TYPE_BYTES, 1, unterminated, 2);
  bad_enc.encoding = 7;
  expect_internal(bad_enc, "unknown string encoding tag 7");

  ray_value_t shaped_null{};
  shaped_null.len = 3;
  expect_internal(shaped_null, "null descriptor is shaped like a vector");
}

TEST(MarshalDecode, RaggedTableIsBindingInternal) {
  const int64_t a[] = {1, 2};
  const int64_t b[] = {1};
  ray_value_t cols[] = {vector_of(RAY_TYPE_I64, 2, a, sizeof(a)),
                        vector_of(RAY_TYPE_I64, 1, b, sizeof(b))};
  const char *names[] = {"a", "b"};
  ray_value_t t{};
  t.type = RAY_TYPE_TABLE;
  t.len = 2;
  t.names = names;
  t.children = cols;

  auto r = table_from_native(&t);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, ErrorKind::BindingInternal);
  EXPECT_EQ(r.error().message, "table column 'b' has 1 rows, column 'a' has 2");
}

TEST(MarshalDecode, TableExpected) {
  const int64_t a[] = {1};
  ray_value_t v = vector_of(RAY_TYPE_I64, 1, a, sizeof(a));
  auto r = table_from_native(&v);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, ErrorKind::BindingInternal);

  EXPECT_FALSE(table_from_native(nullptr).has_value());
}

TEST(MarshalDecode, DuplicateColumnNamesFromEngine) {
  const int64_t a[] = {1};
  ray_value_t cols[] = {vector_of(RAY_TYPE_I64, 1, a, sizeof(a)),
                        vector_of(RAY_TYPE_I64, 1, a, sizeof(a))};
  const char *names[] = {"x", "x"};
  ray_value_t t{};
  t.type = RAY_TYPE_TABLE;
  t.len = 2;
  t.names = names;
  t.children = cols;

  auto r = table_from_native(&t);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, ErrorKind::BindingInternal);
  EXPECT_EQ(r.error().message,
            "engine returned an invalid table: duplicate table column 'x'");
}

TEST(MarshalDecode, InvalidUtf8IsBindingInternal) {
  auto expect_internal = [](const ray_value_t &v, std::string_view message) {
    auto r = from_native(&v);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::BindingInternal);
    EXPECT_EQ(r.error().message, message);
  };

  // Truncated two-byte sequence.
  auto vec = prefixed({"fine", "bad\xc3"});
  ray_value_t str = vector_of(RAY_TYPE_STR, 2, vec.data(), vec.size());
  str.encoding = RAY_STR_LENGTH_PREFIXED;
  expect_internal(str, "string element 1 is not valid UTF-8");

  // Overlong encoding of '/'.
  const char overlong[] = "\xc0\xaf";
  ray_value_t sym = vector_of(RAY_TYPE_SYMBOL, 1, overlong, sizeof(overlong));
  sym.encoding = RAY_STR_NUL_TERMINATED;
  expect_internal(sym, "symbol element 0 is not valid UTF-8");

  auto atom_payload = prefixed({"\xf4\x90\x80\x80"}); // past U+10FFFF
  ray_value_t atom{};
  atom.type = -RAY_TYPE_STR;
  atom.encoding = RAY_STR_LENGTH_PREFIXED;
  atom.len = 1;
  atom.data = atom_payload.data();
  atom.data_bytes = atom_payload.size();
  expect_internal(atom, "string element 0 is not valid UTF-8");

  // The same bytes are fine as BYTES.
  atom.type = -RAY_TYPE_BYTES;
  auto bytes = from_native(&atom);
  ASSERT_TRUE(bytes.has_value());
  EXPECT_EQ(bytes->as_bytes().data, "\xf4\x90\x80\x80");
}

TEST(MarshalDecode, NonZeroReservedBytesAreBindingInternal) {
  auto expect_reserved = [](const ray_value_t &v) {
    auto r = from_native(&v);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::BindingInternal);
    EXPECT_NE(r.error().message.find("non-zero reserved bytes"),
              std::string::npos)
        << r.error().message;
  };

  ray_value_t atom{};
  atom.type = -RAY_TYPE_I64;
  atom.reserved[5] = 1;
  expect_reserved(atom);

  ray_value_t null{};
  null.reserved[0] = 0x80;
  expect_reserved(null);

  const int64_t a[] = {1};
  ray_value_t vec = vector_of(RAY_TYPE_I64, 1, a, sizeof(a));
  vec.reserved[2] = 3;
  expect_reserved(vec);

  // Nested descriptors are checked too.
  ray_value_t col = vector_of(RAY_TYPE_I64, 1, a, sizeof(a));
  col.reserved[0] = 1;
  const char *names[] = {"a"};
  ray_value_t table{};
  table.type = RAY_TYPE_TABLE;
  table.len = 1;
  table.names = names;
  table.children = &col;
  expect_reserved(table);
  EXPECT_FALSE(table_from_native(&table).has_value());

  ray_value_t item{};
  item.type = -RAY_TYPE_B8;
  item.reserved[4] = 9;
  ray_value_t list{};
  list.type = RAY_TYPE_LIST;
  list.len = 1;
  list.children = &item;
  expect_reserved(list);
}

TEST(MarshalDecode, TimeOutsideOneDayIsBindingInternal) {
  const int32_t raw[] = {0, Time::kMillisPerDay};
  ray_value_t v = vector_of(RAY_TYPE_TIME, 2, raw, sizeof(raw));
  auto r = from_native(&v);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, ErrorKind::BindingInternal);
  EXPECT_EQ(r.error().message,
            "time element 1 holds 86400000 ms, outside one day");
}

TEST(MarshalDecode, MalformedContainersAreBindingInternal) {
  auto expect_internal = [](const ray_value_t &v, std::string_view needle) {
    auto r = from_native(&v);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::BindingInternal);
    EXPECT_NE(r.error().message.find(needle), std::string::npos)
        << r.error().message;
  };

  ray_value_t list{};
  list.type = RAY_TYPE_LIST;
  list.len = 2;
  expect_internal(list, "list of 2 items has no children");

  const int64_t keys[] = {1, 2};
  const int64_t vals[] = {10};
  ray_value_t halves[] = {vector_of(RAY_TYPE_I64, 2, keys, sizeof(keys)),
                          vector_of(RAY_TYPE_I64, 1, vals, sizeof(vals))};
  ray_value_t dict{};
  dict.type = RAY_TYPE_DICT;
  dict.len = 2;
  dict.children = halves;
  expect_internal(dict, "dict declares 2 entries, its values hold 1");

  ray_value_t atom_half{};
  atom_half.type = -RAY_TYPE_I64;
  ray_value_t bad_halves[] = {atom_half, atom_half};
  dict.children = bad_halves;
  expect_internal(dict, "dict keys are not a vector or list");

  dict.children = nullptr;
  expect_internal(dict, "dict descriptor has no keys or values");

  // A list is not a valid table column.
  ray_value_t col{};
  col.type = RAY_TYPE_LIST;
  const char *names[] = {"a"};
  ray_value_t table{};
  table.type = RAY_TYPE_TABLE;
  table.len = 1;
  table.names = names;
  table.children = &col;
  expect_internal(table, "table column 'a' is not a vector");
}

TEST(MarshalDecode, EngineNestingIsBounded) {
  std::vector<ray_value_t> chain(100);
  for (size_t i = 0; i + 1 < chain.size(); ++i) {
    chain[i].type = RAY_TYPE_LIST;
    chain[i].len = 1;
    chain[i].children = &chain[i + 1];
  }
  chain.back().type = -RAY_TYPE_I64;
  auto r = from_native(chain.data());
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, ErrorKind::BindingInternal);
  EXPECT_NE(r.error().message.find("nests deeper than 64 levels"),
            std::string::npos);
}

// ============================================================================
// Round trips across every type and both string encodings
// ============================================================================

namespace {

constexpr StringEncoding kEncodings[] = {StringEncoding::LengthPrefixed,
                                         StringEncoding::NulTerminated};

Guid guid_of(uint8_t seed) {
  Guid g;
  for (size_t i = 0; i < g.bytes.size(); ++i)
    g.bytes[i] = static_cast<uint8_t>(seed + i);
  return g;
}

/// Two non-null sample elements for `type`.
std::vector<Value> samples(ElementType type) {
  switch (type) {
  case ElementType::Bool:
    return {Value::boolean(true), Value::boolean(false)};
  case ElementType::U8:
    return {Value::integer(0), Value::integer(255)};
  case ElementType::I16:
    return {Value::integer(-32768), Value::integer(32767)};
  case ElementType::I32:
    return {Value::integer(std::numeric_limits<int32_t>::min()),
            Value::integer(7)};
  case ElementType::I64:
    return {Value::integer(std::numeric_limits<int64_t>::max()),
            Value::integer(-1)};
  case ElementType::F32:
    return {Value::floating(0.25), Value::floating(-1024.5)};
  case ElementType::F64:
    return {Value::floating(0.1), Value::floating(-2.0e300)};
  case ElementType::Timestamp:
    return {Value::timestamp(Timestamp{1'700'000'000'000'000'000}),
            Value::timestamp(Timestamp{-1})};
  case ElementType::Date:
    return {Value::date(Date{19'723}), Value::date(Date{-719'162})};
  case ElementType::Time:
    return {Value::time(Time{0}), Value::time(Time{Time::kMillisPerDay - 1})};
  case ElementType::Guid:
    return {Value::guid(guid_of(1)), Value::guid(guid_of(200))};
  case ElementType::Symbol:
    return {Value::symbol(Symbol{"AAPL"}), Value::symbol(Symbol{""})};
  case ElementType::Char:
    return {Value::string("a"), Value::string("\x7f")};
  case ElementType::String:
    return {Value::string("h\xc3\xa9llo"), Value::string("")};
  case ElementType::Bytes:
    return {Value::bytes(Bytes{"\x01\xff"}), Value::bytes(Bytes{})};
  }
  return {};
}

constexpr ElementType kAllElementTypes[] = {
    ElementType::Bool,      ElementType::U8,     ElementType::I16,
    ElementType::I32,       ElementType::I64,    ElementType::F32,
    ElementType::F64,       ElementType::Timestamp, ElementType::Date,
    ElementType::Time,      ElementType::Guid,   ElementType::Symbol,
    ElementType::Char,      ElementType::String, ElementType::Bytes};

void expect_round_trip(const Value &value, StringEncoding encoding) {
  auto n = to_native(value, encoding);
  ASSERT_TRUE(n.has_value()) << n.error().message;
  auto back = from_native(n->get());
  ASSERT_TRUE(back.has_value()) << back.error().message;
  EXPECT_EQ(*back, value) << format_value(value);
}

} // namespace

TEST(MarshalRoundTrip, EveryElementTypeWithAndWithoutNulls) {
  for (StringEncoding enc : kEncodings) {
    SCOPED_TRACE(to_string(enc));
    for (ElementType type : kAllElementTypes) {
      SCOPED_TRACE(to_string(type));
      std::vector<Value> dense = samples(type);
      expect_round_trip(Value::array(unwrap(Array::make(type, dense))), enc);

      std::vector<Value> sparse = {Value::null(), dense[0], Value::null(),
                                   dense[1]};
      expect_round_trip(Value::array(unwrap(Array::make(type, sparse))), enc);

      expect_round_trip(
          Value::array(unwrap(Array::make(type, {Value::null()}))), enc);
      expect_round_trip(Value::array(Array(type)), enc);
    }
  }
}

TEST(MarshalRoundTrip, EveryValueKind) {
  Table table = unwrap(Table::make(
      {{"id", Array(ElementType::I64, {Value::integer(1), Value::null()})},
       {"sym", Array(ElementType::Symbol,
                     {Value::symbol(Symbol{"x"}), Value::null()})}}));
  const Value values[] = {
      Value::null(),
      Value::boolean(true),
      Value::integer(-42),
      Value::floating(3.5),
      Value::timestamp(Timestamp{123}),
      Value::date(Date{-3}),
      Value::time(Time{45'296'789}),
      Value::guid(guid_of(9)),
      Value::symbol(Symbol{"bid"}),
      Value::string("\xe2\x82\xac"),
      Value::bytes(Bytes{"\x01\x02"}),
      Value::array(unwrap(Array::make(ElementType::I16, {Value::integer(3)}))),
      Value::list(List({Value::null(), Value::string("s"),
                        Value::list(List()), Value::table(table)})),
      Value::dict(unwrap(Dict::make(
          Value::array(Array(ElementType::Symbol, {Value::symbol(Symbol{"k"})})),
          Value::list(List({Value::array(Array(ElementType::F64))}))))),
      Value::dict(Dict()),
      Value::table(table),
  };
  for (StringEncoding enc : kEncodings) {
    SCOPED_TRACE(to_string(enc));
    for (const Value &v : values) {
      SCOPED_TRACE(to_string(v.kind()));
      expect_round_trip(v, enc);
    }
  }
}

TEST(MarshalRoundTrip, EmptyTablesKeepEveryColumn) {
  std::vector<Column> columns;
  for (ElementType type : kAllElementTypes)
    columns.push_back(Column{std::string(to_string(type)), Array(type)});
  Table empty = unwrap(Table::make(std::move(columns)));
  ASSERT_EQ(empty.num_columns(), std::size(kAllElementTypes));

  for (StringEncoding enc : kEncodings) {
    SCOPED_TRACE(to_string(enc));
    auto n = to_native(Value::table(empty), enc);
    ASSERT_TRUE(n.has_value());
    auto back = table_from_native(n->get());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, empty);
    EXPECT_EQ(back->num_rows(), 0u);
    EXPECT_TRUE(back->same_layout(empty));
  }

  expect_round_trip(Value::table(Table()), StringEncoding::LengthPrefixed);
}
