#include "raybind/build_info.hpp"
#include "raybind/engine.hpp"
#include "raybind/error.hpp"
#include "raybind/log.hpp"
#include "raybind/session.hpp"
#include "raybind/value.hpp"
#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/vector.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace {

using raybind::Array;
using raybind::Dict;
using raybind::ElementType;
using raybind::ErrorKind;
using raybind::List;
using raybind::Table;
using raybind::Value;
using raybind::ValueKind;

[[noreturn]] void invalid(std::string message) {
  raybind::throw_error(
      raybind::make_error(ErrorKind::InvalidArgument, std::move(message)));
}

// ===========================================================================
// Logging bridge
// ===========================================================================
//
// The sink can be called on threads that do not hold the GIL (every engine
// call runs with it released). Those messages are queued and forwarded to
// Python the next time this module reacquires the GIL.

constexpr size_t kMaxPendingLogs = 4096;

struct PendingLogs {
  std::mutex mutex;
  std::vector<std::pair<raybind::log::Level, std::string>> items;
  size_t dropped = 0;
};

PendingLogs &pending_logs() {
  static PendingLogs logs;
  return logs;
}

int python_level(raybind::log::Level lvl) {
  switch (lvl) {
  case raybind::log::Level::Trace:
    return 5;
  case raybind::log::Level::Debug:
    return 10;
  case raybind::log::Level::Info:
    return 20;
  case raybind::log::Level::Warn:
    return 30;
  case raybind::log::Level::Error:
  case raybind::log::Level::Off:
    break;
  }
  return 40;
}

// Requires the GIL.
bool python_finalizing() {
  if (Py_IsInitialized() == 0)
    return true;
  nb::module_ sys = nb::module_::import_("sys");
  if (!nb::hasattr(sys, "_is_finalizing"))
    return false;
  nb::object finalizing = sys.attr("_is_finalizing")();
  return PyObject_IsTrue(finalizing.ptr()) == 1;
}

// Requires the GIL.
void emit_to_python(raybind::log::Level lvl, std::string_view message) {
  try {
    if (python_finalizing())
      return;
    nb::object logger =
        nb::module_::import_("logging").attr("getLogger")("rayforce");
    logger.attr("log")(python_level(lvl),
                       nb::str(message.data(), message.size()));
  } catch (nb::python_error &e) {
    e.discard_as_unraisable(nb::str("rayforce log bridge"));
  }
}

void flush_pending_logs() {
  std::vector<std::pair<raybind::log::Level, std::string>> items;
  size_t dropped = 0;
  {
    auto &logs = pending_logs();
    std::lock_guard lock(logs.mutex);
    items.swap(logs.items);
    std::swap(dropped, logs.dropped);
  }
  for (const auto &[lvl, message] : items)
    emit_to_python(lvl, message);
  if (dropped > 0)
    emit_to_python(raybind::log::Level::Warn,
                   std::to_string(dropped) +
                       " log messages dropped while the GIL was released");
}

void python_sink(raybind::log::Level lvl, std::string_view message) {
  if (Py_IsInitialized() == 0)
    return;
  if (PyGILState_Check() == 0) {
    auto &logs = pending_logs();
    std::lock_guard lock(logs.mutex);
    if (logs.items.size() >= kMaxPendingLogs) {
      ++logs.dropped;
      return;
    }
    logs.items.emplace_back(lvl, std::string(message));
    return;
  }
  emit_to_python(lvl, message);
}

struct LogFlush {
  LogFlush() = default;
  LogFlush(const LogFlush &) = delete;
  LogFlush &operator=(const LogFlush &) = delete;
  ~LogFlush() { flush_pending_logs(); }
};

/// Runs `fn` with the GIL released, then forwards queued log messages.
template <typename F> decltype(auto) without_gil(F &&fn) {
  LogFlush flush;
  nb::gil_scoped_release release;
  return fn();
}

// ===========================================================================
// Exceptions
// ===========================================================================

constexpr size_t kErrorKinds =
    static_cast<size_t>(ErrorKind::BindingInternal) + 1;

// Owned for the life of the process; the module also holds a reference.
std::array<nb::handle, kErrorKinds> g_error_types{};

void register_exceptions(nb::module_ &m) {
  nb::object base = nb::steal(PyErr_NewExceptionWithDoc(
      "_rayforce.RayforceError",
      "Base class of every error raised by the engine binding. Carries the "
      "raw engine `status` (0 for binding-side failures) and `fatal`.",
      PyExc_RuntimeError, nullptr));
  if (!base.is_valid())
    throw nb::python_error();
  m.attr("RayforceError") = base;

  for (size_t i = 0; i < kErrorKinds; ++i) {
    const auto kind = static_cast<ErrorKind>(i);
    const std::string name = std::string(raybind::to_string(kind)) + "Error";
    const std::string qualified = "_rayforce." + name;
    nb::object type = nb::steal(
        PyErr_NewException(qualified.c_str(), base.ptr(), nullptr));
    if (!type.is_valid())
      throw nb::python_error();
    m.attr(name.c_str()) = type;
    g_error_types[i] = type.release();
  }

  nb::register_exception_translator(
      [](const std::exception_ptr &p, void *) {
        try {
          std::rethrow_exception(p);
        } catch (const raybind::Error &e) {
          nb::handle type = g_error_types[static_cast<size_t>(e.kind())];
          nb::object exc = type(e.what());
          exc.attr("status") = e.status();
          exc.attr("fatal") = e.fatal();
          PyErr_SetObject(type.ptr(), exc.ptr());
        }
      });
}

// ===========================================================================
// Python <-> Value
// ===========================================================================

Value to_value(nb::handle obj);
Array infer_array(nb::handle seq, std::string_view what);

/// datetime.date ordinal of 1970-01-01.
constexpr int64_t kUnixEpochOrdinal = 719'163;
/// datetime.date.max.toordinal()
constexpr int64_t kMaxDateOrdinal = 3'652'059;

// Standard-library types, resolved once at import and kept for the process.
struct HostTypes {
  nb::handle date;
  nb::handle time;
  nb::handle datetime;
  nb::handle uuid;
};
HostTypes g_host;

void resolve_host_types() {
  nb::module_ datetime = nb::module_::import_("datetime");
  g_host.date = datetime.attr("date").release();
  g_host.time = datetime.attr("time").release();
  g_host.datetime = datetime.attr("datetime").release();
  g_host.uuid = nb::module_::import_("uuid").attr("UUID").release();
}

bool is_instance(nb::handle obj, nb::handle type) {
  const int r = PyObject_IsInstance(obj.ptr(), type.ptr());
  if (r < 0)
    throw nb::python_error();
  return r == 1;
}

bool is_text_or_bytes(nb::handle obj) {
  return nb::isinstance<nb::str>(obj) || nb::isinstance<nb::bytes>(obj) ||
         PyByteArray_Check(obj.ptr());
}

raybind::Date date_from_python(nb::handle obj) {
  const auto ordinal = nb::cast<int64_t>(obj.attr("toordinal")());
  return raybind::Date{static_cast<int32_t>(ordinal - kUnixEpochOrdinal)};
}

raybind::Time time_from_python(nb::handle obj) {
  if (!obj.attr("tzinfo").is_none())
    invalid("time values must be naive; got tzinfo " +
            nb::cast<std::string>(nb::str(obj.attr("tzinfo"))));
  const auto hour = nb::cast<int32_t>(obj.attr("hour"));
  const auto minute = nb::cast<int32_t>(obj.attr("minute"));
  const auto second = nb::cast<int32_t>(obj.attr("second"));
  const auto micros = nb::cast<int32_t>(obj.attr("microsecond"));
  if (micros % 1000 != 0)
    invalid("time " + nb::cast<std::string>(nb::str(obj)) +
            " has sub-millisecond precision");
  return raybind::Time{((hour * 60 + minute) * 60 + second) * 1000 +
                       micros / 1000};
}

raybind::Guid guid_from_python(nb::handle obj) {
  nb::bytes raw = nb::borrow<nb::bytes>(obj.attr("bytes"));
  raybind::Guid g;
  if (raw.size() != g.bytes.size())
    invalid("UUID.bytes must hold 16 bytes");
  std::memcpy(g.bytes.data(), raw.c_str(), g.bytes.size());
  return g;
}

/// c8 elements are single code points below 256, stored as one byte.
Value char_from_python(nb::handle obj, size_t index) {
  if (!nb::isinstance<nb::str>(obj))
    return to_value(obj);
  const Py_ssize_t n = PyUnicode_GetLength(obj.ptr());
  if (n < 0)
    throw nb::python_error();
  const Py_UCS4 cp = n == 1 ? PyUnicode_ReadChar(obj.ptr(), 0) : 0;
  if (n != 1 || cp > 0xFF)
    invalid("c8 element " + std::to_string(index) +
            " must be a single character below U+0100");
  return Value::string(std::string(1, static_cast<char>(cp)));
}

std::string type_name(nb::handle obj) {
  return nb::cast<std::string>(nb::type_name(obj.type()));
}

ElementType inferred_type(ValueKind kind, std::string_view what) {
  switch (kind) {
  case ValueKind::Bool:
    return ElementType::Bool;
  case ValueKind::Int:
    return ElementType::I64;
  case ValueKind::Float:
    return ElementType::F64;
  case ValueKind::Timestamp:
    return ElementType::Timestamp;
  case ValueKind::Date:
    return ElementType::Date;
  case ValueKind::Time:
    return ElementType::Time;
  case ValueKind::Guid:
    return ElementType::Guid;
  case ValueKind::Symbol:
    return ElementType::Symbol;
  case ValueKind::String:
    return ElementType::String;
  case ValueKind::Bytes:
    return ElementType::Bytes;
  case ValueKind::Null:
  case ValueKind::Array:
  case ValueKind::List:
  case ValueKind::Dict:
  case ValueKind::Table:
    break;
  }
  invalid(std::string(what) + ": " + std::string(raybind::to_string(kind)) +
          " values cannot be array elements");
}

Array infer_array(nb::handle seq, std::string_view what) {
  std::vector<Value> items;
  items.reserve(nb::len(seq));
  for (nb::handle item : seq)
    items.push_back(to_value(item));

  const Value *first = nullptr;
  for (const Value &v : items) {
    if (!v.is_null()) {
      first = &v;
      break;
    }
  }
  if (first == nullptr)
    invalid(std::string(what) +
            ": cannot infer the element type of an empty or all-None list; "
            "use Array(type, items)");

  const ElementType type = inferred_type(first->kind(), what);
  for (size_t i = 0; i < items.size(); ++i) {
    if (!items[i].is_null() && items[i].kind() != first->kind())
      invalid(std::string(what) + ": element " + std::to_string(i) + " is " +
              std::string(raybind::to_string(items[i].kind())) +
              ", expected " +
              std::string(raybind::to_string(first->kind())));
  }
  return raybind::unwrap(Array::make(type, std::move(items)));
}

Table table_from_dict(nb::dict dict) {
  std::vector<raybind::Column> columns;
  columns.reserve(dict.size());
  for (auto [key, column] : dict) {
    if (!nb::isinstance<nb::str>(key))
      invalid("table column names must be str, got " + type_name(key));
    std::string name = nb::cast<std::string>(key);
    if (nb::isinstance<Array>(column)) {
      columns.push_back({std::move(name), nb::cast<Array>(column)});
    } else if (nb::isinstance<nb::list>(column) ||
               nb::isinstance<nb::tuple>(column)) {
      Array data = infer_array(column, "column '" + name + "'");
      columns.push_back({std::move(name), std::move(data)});
    } else {
      invalid("column '" + name + "' must be a list or Array, got " +
              type_name(column));
    }
  }
  return raybind::unwrap(Table::make(std::move(columns)));
}

Value to_value(nb::handle obj) {
  if (obj.is_none())
    return Value::null();
  if (PyBool_Check(obj.ptr()))
    return Value::boolean(obj.ptr() == Py_True);
  if (PyLong_Check(obj.ptr())) {
    int overflow = 0;
    const long long v = PyLong_AsLongLongAndOverflow(obj.ptr(), &overflow);
    if (overflow != 0)
      invalid("integer " + nb::cast<std::string>(nb::str(obj)) +
              " does not fit in int64");
    if (v == -1 && PyErr_Occurred())
      throw nb::python_error();
    return Value::integer(static_cast<int64_t>(v));
  }
  if (PyFloat_Check(obj.ptr()))
    return Value::floating(PyFloat_AsDouble(obj.ptr()));
  if (nb::isinstance<nb::str>(obj))
    return Value::string(nb::cast<std::string>(obj));
  if (nb::isinstance<nb::bytes>(obj)) {
    nb::bytes b = nb::borrow<nb::bytes>(obj);
    return Value::bytes(raybind::Bytes{std::string(b.c_str(), b.size())});
  }
  if (nb::isinstance<raybind::Timestamp>(obj))
    return Value::timestamp(nb::cast<raybind::Timestamp>(obj));
  // datetime is a date subclass; it has no engine counterpart here.
  if (is_instance(obj, g_host.datetime))
    invalid("datetime.datetime is not supported; pass a Timestamp or a date");
  if (is_instance(obj, g_host.date))
    return Value::date(date_from_python(obj));
  if (is_instance(obj, g_host.time))
    return Value::time(time_from_python(obj));
  if (is_instance(obj, g_host.uuid))
    return Value::guid(guid_from_python(obj));
  if (nb::isinstance<raybind::Symbol>(obj))
    return Value::symbol(nb::cast<raybind::Symbol>(obj));
  if (nb::isinstance<Array>(obj))
    return Value::array(nb::cast<Array>(obj));
  if (nb::isinstance<Dict>(obj))
    return Value::dict(nb::cast<Dict>(obj));
  if (nb::isinstance<Table>(obj))
    return Value::table(nb::cast<Table>(obj));
  if (nb::isinstance<nb::dict>(obj))
    return Value::table(table_from_dict(nb::borrow<nb::dict>(obj)));
  if (nb::isinstance<nb::list>(obj))
    return Value::array(infer_array(obj, "list"));
  if (nb::isinstance<nb::tuple>(obj)) {
    std::vector<Value> items;
    items.reserve(nb::len(obj));
    for (nb::handle item : obj)
      items.push_back(to_value(item));
    return Value::list(List(std::move(items)));
  }
  invalid("cannot convert Python " + type_name(obj) + " to an engine value");
}

std::vector<Value> to_params(const std::optional<nb::sequence> &params,
                             std::string_view what) {
  std::vector<Value> out;
  if (!params)
    return out;
  if (is_text_or_bytes(*params))
    invalid(std::string(what) + " must be a list or tuple, not " +
            type_name(*params));
  out.reserve(nb::len(*params));
  for (nb::handle item : *params)
    out.push_back(to_value(item));
  return out;
}

nb::object from_value(const Value &value);

nb::object element_to_python(ElementType type, const Value &item);

nb::list array_to_list(const Array &array) {
  nb::list out;
  for (const Value &item : array.items())
    out.append(element_to_python(array.type(), item));
  return out;
}

std::vector<Value> array_items(ElementType type,
                               const std::optional<nb::sequence> &items) {
  if (type != ElementType::Char)
    return to_params(items, "Array items");
  std::vector<Value> out;
  if (!items)
    return out;
  if (is_text_or_bytes(*items))
    invalid("Array items must be a list or tuple, not " + type_name(*items));
  size_t i = 0;
  for (nb::handle item : *items)
    out.push_back(char_from_python(item, i++));
  return out;
}

nb::object from_value(const Value &value) {
  switch (value.kind()) {
  case ValueKind::Null:
    return nb::none();
  case ValueKind::Bool:
    return nb::bool_(value.as_bool());
  case ValueKind::Int:
    return nb::int_(value.as_int());
  case ValueKind::Float:
    return nb::float_(value.as_float());
  case ValueKind::Timestamp:
    return nb::cast(value.as_timestamp());
  case ValueKind::Date: {
    const int64_t ordinal = value.as_date().days + kUnixEpochOrdinal;
    if (ordinal < 1 || ordinal > kMaxDateOrdinal)
      raybind::throw_error(raybind::make_error(
          ErrorKind::Unsupported,
          "date " + std::to_string(value.as_date().days) +
              " days from 1970-01-01 is outside datetime.date's range"));
    return g_host.date.attr("fromordinal")(ordinal);
  }
  case ValueKind::Time: {
    const int32_t ms = value.as_time().millis;
    return g_host.time(ms / 3'600'000, ms / 60'000 % 60, ms / 1000 % 60,
                       ms % 1000 * 1000);
  }
  case ValueKind::Guid: {
    const auto &b = value.as_guid().bytes;
    return g_host.uuid("bytes"_a = nb::bytes(b.data(), b.size()));
  }
  case ValueKind::Symbol:
    return nb::cast(value.as_symbol());
  case ValueKind::String: {
    const auto &s = value.as_string();
    return nb::str(s.data(), s.size());
  }
  case ValueKind::Bytes: {
    const auto &b = value.as_bytes().data;
    return nb::bytes(b.data(), b.size());
  }
  case ValueKind::Array:
    return nb::cast(value.as_array());
  case ValueKind::List: {
    const List &list = value.as_list();
    nb::list out;
    for (const Value &item : list.items())
      out.append(from_value(item));
    return nb::tuple(out);
  }
  case ValueKind::Dict:
    return nb::cast(value.as_dict());
  case ValueKind::Table:
    return nb::cast(value.as_table());
  }
  return nb::none();
}

/// Element `item` of an array of `type`; c8 bytes come back as latin-1.
nb::object element_to_python(ElementType type, const Value &item) {
  if (type == ElementType::Char && !item.is_null()) {
    const auto byte = static_cast<unsigned char>(item.as_string().front());
    nb::object ch = nb::steal(PyUnicode_FromOrdinal(byte));
    if (!ch.is_valid())
      throw nb::python_error();
    return ch;
  }
  return from_value(item);
}

const raybind::Column &column_or_raise(const Table &t, std::string_view name) {
  const raybind::Column *col = t.find(name);
  if (col == nullptr)
    raybind::throw_error(raybind::make_error(
        ErrorKind::NotFound, "no column named '" + std::string(name) + "'"));
  return *col;
}

ElementType element_type_or_raise(std::string_view name) {
  auto type = raybind::parse_element_type(name);
  if (!type)
    invalid("unknown element type '" + std::string(name) + "'");
  return *type;
}

raybind::StringEncoding encoding_or_raise(std::string_view name) {
  if (name == raybind::to_string(raybind::StringEncoding::LengthPrefixed))
    return raybind::StringEncoding::LengthPrefixed;
  if (name == raybind::to_string(raybind::StringEncoding::NulTerminated))
    return raybind::StringEncoding::NulTerminated;
  invalid("unknown string encoding '" + std::string(name) + "'");
}

} // namespace

NB_MODULE(_rayforce, m) {
  m.doc() = "RayforceDB native engine binding";

  register_exceptions(m);
  resolve_host_types();

  // --- Logging ---
  raybind::log::set_sink(&python_sink);
  nb::module_::import_("atexit").attr("register")(
      nb::cpp_function([] { raybind::log::set_sink({}); }));

  m.def(
      "set_log_level",
      [](std::string_view name) {
        auto lvl = raybind::log::parse_level(name);
        if (!lvl)
          invalid("unknown log level '" + std::string(name) + "'");
        raybind::log::set_level(*lvl);
      },
      "level"_a,
      "Set the binding's log threshold (trace, debug, info, warn, error, "
      "off). Messages go to logging.getLogger('rayforce').");
  m.def("get_log_level",
        [] { return raybind::log::level_name(raybind::log::level()); });

  // --- Build info ---
  m.def("version", &raybind::version, "Binding version");

  nb::class_<raybind::BuildInfo>(m, "BuildInfo")
      .def_ro("version", &raybind::BuildInfo::version)
      .def_ro("abi_version", &raybind::BuildInfo::abi_version)
      .def_ro("default_engine", &raybind::BuildInfo::default_engine)
      .def_ro("element_types", &raybind::BuildInfo::element_types)
      .def_ro("string_encodings", &raybind::BuildInfo::string_encodings)
      .def("__repr__", [](const raybind::BuildInfo &b) {
        return "<BuildInfo version=" + b.version +
               " abi=" + std::to_string(b.abi_version) + " engine='" +
               b.default_engine + "'>";
      });

  m.def("get_build_info", &raybind::build_info,
        "Binding version, engine contract revision and supported types");

  // --- Values ---
  nb::class_<raybind::Timestamp>(m, "Timestamp")
      .def(nb::init<>())
      .def("__init__",
           [](raybind::Timestamp *t, int64_t nanos) {
             new (t) raybind::Timestamp{nanos};
           },
           "nanos"_a)
      .def_rw("nanos", &raybind::Timestamp::nanos,
              "Nanoseconds since the Unix epoch")
      .def("__eq__", [](const raybind::Timestamp &a,
                        const raybind::Timestamp &b) { return a == b; })
      .def("__hash__",
           [](const raybind::Timestamp &t) { return nb::hash(nb::int_(t.nanos)); })
      .def("__repr__", [](const raybind::Timestamp &t) {
        return "Timestamp(" + std::to_string(t.nanos) + ")";
      });

  nb::class_<raybind::Symbol>(m, "Symbol")
      .def(
          "__init__",
          [](raybind::Symbol *sym, std::string name) {
            new (sym) raybind::Symbol{std::move(name)};
          },
          "name"_a, "Interned engine name; str values travel as strings.")
      .def_ro("name", &raybind::Symbol::name)
      .def("__eq__", [](const raybind::Symbol &a,
                        const raybind::Symbol &b) { return a == b; })
      .def("__hash__",
           [](const raybind::Symbol &sym) { return nb::hash(nb::str(
                                                  sym.name.data(),
                                                  sym.name.size())); })
      .def("__repr__", [](const raybind::Symbol &sym) {
        return "Symbol(" + nb::cast<std::string>(nb::repr(nb::str(
                               sym.name.data(), sym.name.size()))) +
               ")";
      });

  nb::class_<Array>(m, "Array")
      .def(
          "__init__",
          [](Array *a, std::string_view type,
             const std::optional<nb::sequence> &items) {
            const ElementType et = element_type_or_raise(type);
            new (a) Array(raybind::unwrap(Array::make(et, array_items(et, items))));
          },
          "type"_a, "items"_a = nb::none(),
          "Typed array. Required for empty or all-None columns.")
      .def_prop_ro("type",
                   [](const Array &a) { return raybind::to_string(a.type()); })
      .def("__len__", &Array::size)
      .def("__getitem__",
           [](const Array &a, Py_ssize_t i) {
             const auto n = static_cast<Py_ssize_t>(a.size());
             if (i < 0)
               i += n;
             if (i < 0 || i >= n)
               throw nb::index_error("array index out of range");
             return element_to_python(a.type(), a[static_cast<size_t>(i)]);
           })
      .def("to_list", &array_to_list)
      .def("__eq__", [](const Array &a, const Array &b) { return a == b; })
      .def("__repr__",
           [](const Array &a) { return raybind::format_value(Value::array(a)); });

  nb::class_<Dict>(m, "Dict")
      .def(nb::init<>())
      .def(
          "__init__",
          [](Dict *d, nb::handle keys, nb::handle values) {
            new (d) Dict(raybind::unwrap(Dict::make(to_value(keys),
                                                    to_value(values))));
          },
          "keys"_a, "values"_a,
          "Engine dict. keys and values are each a list or Array (typed) "
          "or a tuple (mixed), of the same length.")
      .def("keys", [](const Dict &d) { return from_value(d.keys()); })
      .def("values", [](const Dict &d) { return from_value(d.values()); })
      .def("__len__", &Dict::size)
      .def("__eq__", [](const Dict &a, const Dict &b) { return a == b; })
      .def("__repr__",
           [](const Dict &d) { return raybind::format_value(Value::dict(d)); });

  nb::class_<Table>(m, "Table")
      .def(nb::init<>())
      .def(
          "__init__",
          [](Table *t, nb::dict columns) {
            new (t) Table(table_from_dict(columns));
          },
          "columns"_a, "Build a table from {name: list | Array}.")
      .def_prop_ro("num_rows", &Table::num_rows)
      .def_prop_ro("num_columns", &Table::num_columns)
      .def_prop_ro("column_names", &Table::column_names)
      .def("__len__", &Table::num_rows)
      .def("__contains__",
           [](const Table &t, std::string_view name) {
             return t.find(name) != nullptr;
           })
      .def("__getitem__",
           [](const Table &t, std::string_view name) {
             return array_to_list(column_or_raise(t, name).data);
           })
      .def("column",
           [](const Table &t, std::string_view name) {
             return column_or_raise(t, name).data;
           },
           "name"_a)
      .def("to_dict",
           [](const Table &t) {
             nb::dict out;
             for (const auto &col : t.columns())
               out[nb::str(col.name.data(), col.name.size())] =
                   array_to_list(col.data);
             return out;
           })
      .def("__eq__", [](const Table &a, const Table &b) { return a == b; })
      .def("__repr__",
           [](const Table &t) { return raybind::format_value(Value::table(t)); });

  // --- Engine ---
  nb::class_<raybind::Runtime>(m, "Runtime")
      .def_prop_ro("name", &raybind::Runtime::name)
      .def(
          "connect",
          [](const std::shared_ptr<raybind::Runtime> &self, std::string uri,
             size_t fetch_batch_rows, std::string_view string_encoding) {
            raybind::ConnectOptions options{
                .uri = std::move(uri),
                .fetch_batch_rows = fetch_batch_rows,
                .string_encoding = encoding_or_raise(string_encoding)};
            return without_gil([&] {
              return raybind::Connection::open(self, std::move(options));
            });
          },
          "uri"_a = "", "fetch_batch_rows"_a = 1024,
          "string_encoding"_a = "length-prefixed",
          "Open a connection. An empty uri is in-process.");

  m.def(
      "load",
      [](std::string path, uint32_t init_flags) {
        return without_gil([&] {
          return raybind::unwrap(raybind::Runtime::load(
              {.library_path = std::move(path), .init_flags = init_flags}));
        });
      },
      "path"_a = "", "init_flags"_a = 0,
      "Load the engine library (default: $RAYFORCE_LIBRARY, then the "
      "platform name) and initialize its runtime. Loading the same path "
      "again returns the same Runtime.");
  m.def("default_library_path", &raybind::Runtime::default_library_path);

  // --- Connection (context manager) ---
  nb::class_<raybind::Connection>(m, "Connection")
      .def("__enter__", [](nb::object self) -> nb::object { return self; })
      .def("__exit__",
           [](raybind::Connection &self, nb::args) {
             without_gil([&] { self.close(/*force=*/true); });
           })
      .def(
          "close",
          [](raybind::Connection &self, bool force) {
            without_gil([&] { self.close(force); });
          },
          "force"_a = false,
          "Close the connection. force=True closes open statements and "
          "result sets first; otherwise they make close() fail.")
      .def_prop_ro("is_open", &raybind::Connection::is_open)
      .def_prop_ro("state",
                   [](const raybind::Connection &self) {
                     return raybind::to_string(self.state());
                   })
      .def_prop_ro("live_children", &raybind::Connection::live_children)
      .def(
          "prepare",
          [](raybind::Connection &self, std::string query) {
            return without_gil([&] { return self.prepare(query); });
          },
          "query"_a)
      .def(
          "execute",
          [](raybind::Connection &self, std::string query,
             const std::optional<nb::sequence> &params) {
            std::vector<Value> values = to_params(params, "params");
            return without_gil([&] { return self.execute(query, values); });
          },
          "query"_a, "params"_a = nb::none(),
          "Prepare, execute and fetch every row.")
      .def(
          "cancel",
          [](raybind::Connection &self) {
            without_gil([&] { self.cancel(); });
          },
          "Cancel every open result set. Does not wait for in-flight calls.")
      .def_prop_ro("last_error",
                   [](const raybind::Connection &self)
                       -> std::optional<std::string> {
                     auto err = self.last_error();
                     if (!err)
                       return std::nullopt;
                     return err->describe();
                   });

  nb::class_<raybind::Statement>(m, "Statement")
      .def("__enter__", [](nb::object self) -> nb::object { return self; })
      .def("__exit__",
           [](raybind::Statement &self, nb::args) {
             without_gil([&] { self.close(); });
           })
      .def(
          "execute",
          [](raybind::Statement &self,
             const std::optional<nb::sequence> &params) {
            std::vector<Value> values = to_params(params, "params");
            return without_gil([&] { return self.execute(values); });
          },
          "params"_a = nb::none())
      .def("close",
           [](raybind::Statement &self) {
             without_gil([&] { self.close(); });
           })
      .def_prop_ro("query", &raybind::Statement::query)
      .def_prop_ro("state", [](const raybind::Statement &self) {
        return raybind::to_string(self.state());
      });

  // --- ResultSet (context manager, iterable by batch) ---
  nb::class_<raybind::ResultSet>(m, "ResultSet")
      .def("__enter__", [](nb::object self) -> nb::object { return self; })
      .def("__exit__",
           [](raybind::ResultSet &self, nb::args) {
             without_gil([&] { self.close(); });
           })
      .def("__iter__", [](nb::object self) -> nb::object { return self; })
      .def("__next__",
           [](raybind::ResultSet &self) {
             std::optional<Table> batch =
                 without_gil([&] { return self.fetch_batch(); });
             if (!batch)
               throw nb::stop_iteration();
             return std::move(*batch);
           })
      .def(
          "fetch_batch",
          [](raybind::ResultSet &self, size_t max_rows) {
            return without_gil([&] { return self.fetch_batch(max_rows); });
          },
          "max_rows"_a = 0,
          "Next batch, or None once exhausted. 0 uses the connection's "
          "fetch_batch_rows.")
      .def("fetch_all",
           [](raybind::ResultSet &self) {
             return without_gil([&] { return self.fetch_all(); });
           })
      .def("columns",
           [](raybind::ResultSet &self) {
             auto cols = without_gil([&] { return self.columns(); });
             nb::list out;
             for (const auto &c : cols)
               out.append(nb::make_tuple(c.name, raybind::to_string(c.type)));
             return out;
           })
      .def("cancel", &raybind::ResultSet::cancel)
      .def("close",
           [](raybind::ResultSet &self) {
             without_gil([&] { self.close(); });
           })
      .def_prop_ro("state", [](const raybind::ResultSet &self) {
        return raybind::to_string(self.state());
      });
}
