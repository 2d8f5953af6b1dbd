#include "raybind/session.hpp"

#include "raybind/handle_registry.hpp"
#include "raybind/log.hpp"

#include <atomic>
#include <format>
#include <mutex>
#include <type_traits>

namespace raybind {

std::string_view to_string(ConnectionState state) noexcept {
  switch (state) {
  case ConnectionState::Closed:
    return "closed";
  case ConnectionState::Open:
    return "open";
  }
  return "unknown";
}

std::string_view to_string(CursorState state) noexcept {
  switch (state) {
  case CursorState::Unprepared:
    return "unprepared";
  case CursorState::Prepared:
    return "prepared";
  case CursorState::Executing:
    return "executing";
  case CursorState::Exhausted:
    return "exhausted";
  case CursorState::Closed:
    return "closed";
  }
  return "unknown";
}

using Lock = Dispatcher::Lock;

// ===========================================================================
// Shared state behind the wrappers
// ===========================================================================

namespace detail {

struct Session {
  Session(std::shared_ptr<Runtime> rt, ConnectOptions opts)
      : runtime(std::move(rt)), options(std::move(opts)),
        dispatcher(runtime, options.string_encoding) {}

  ~Session();

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  /// Stored fatal error, or InvalidArgument once closed.
  Result<void> usable(const Lock &lock) const {
    if (auto ok = dispatcher.check(lock); !ok)
      return ok;
    if (state.load() != ConnectionState::Open)
      return fail(ErrorKind::InvalidArgument, "connection is closed");
    return {};
  }

  void check(const Lock &lock) const { raybind::unwrap(usable(lock)); }

  bool is_usable() const noexcept {
    return !dispatcher.poisoned() && state.load() == ConnectionState::Open;
  }

  /// Throws `err`; a fatal error invalidates the connection first.
  [[noreturn]] void raise(const Lock &lock, BindError err) {
    if (err.fatal())
      invalidate(lock, err);
    throw_error(std::move(err));
  }

  template <typename T> T unwrap(const Lock &lock, Result<T> &&r) {
    if (!r)
      raise(lock, std::move(r).error());
    if constexpr (!std::is_void_v<T>)
      return std::move(*r);
  }

  /// Poison the dispatcher and release every native handle of the
  /// connection.
  void invalidate(const Lock &lock, const BindError &cause);

  /// Register a native handle, closing it again if registration fails.
  ScopedHandle adopt(const Lock &lock, HandleKind kind, const void *native,
                     HandleToken parent, Closer closer);

  void track(const std::shared_ptr<CursorCore> &cursor);

  // Declared first: outlives every handle below.
  std::shared_ptr<Runtime> runtime;
  ConnectOptions options;
  Dispatcher dispatcher;
  ScopedHandle handle;
  ray_conn_t *native = nullptr;
  std::atomic<ConnectionState> state{ConnectionState::Closed};

  // Guards `cursors` only; never held while taking the dispatcher lock.
  std::mutex children_mutex;
  std::vector<std::weak_ptr<CursorCore>> cursors;
};

struct StatementCore {
  StatementCore(std::shared_ptr<Session> s, std::string q)
      : session(std::move(s)), query(std::move(q)) {}

  ~StatementCore();

  std::shared_ptr<Session> session;
  std::string query;
  ray_stmt_t *native = nullptr;
  ScopedHandle handle;
  std::atomic<CursorState> state{CursorState::Unprepared};
};

struct CursorCore {
  explicit CursorCore(std::shared_ptr<StatementCore> stmt)
      : statement(std::move(stmt)) {}

  ~CursorCore();

  Session &session() const { return *statement->session; }

  /// Release the cursor and hand the statement back.
  Result<void> finish(const Lock &lock, CursorState next);

  /// Throws InvalidArgument unless the cursor is Executing.
  void check_open() const;

  /// Fetch the next batch, tracking the layout. std::nullopt at the end.
  std::optional<Table> next(const Lock &lock, size_t max_rows);

  std::shared_ptr<StatementCore> statement;
  ray_cursor_t *native = nullptr;
  ScopedHandle handle;
  std::atomic<CursorState> state{CursorState::Unprepared};
  std::atomic<bool> cancelled{false};
  std::optional<Table> pending; // first batch, read early by columns()
  std::optional<std::vector<ColumnInfo>> layout;
};

namespace {

std::vector<ColumnInfo> layout_of(const Table &table) {
  std::vector<ColumnInfo> out;
  out.reserve(table.num_columns());
  for (const auto &col : table.columns())
    out.push_back(ColumnInfo{col.name, col.data.type()});
  return out;
}

} // namespace

Session::~Session() {
  auto lock = dispatcher.serialize();
  if (state.load() != ConnectionState::Open)
    return;
  state.store(ConnectionState::Closed);
  if (auto r = handle.release(); !r)
    RAYBIND_LOG_WARN("closing connection: {}", r.error().describe());
  else
    RAYBIND_LOG_DEBUG("connection closed on release");
}

void Session::invalidate(const Lock &, const BindError &cause) {
  dispatcher.poison(cause);
  if (state.exchange(ConnectionState::Closed) != ConnectionState::Open)
    return;
  auto r = runtime->registry().release_cascade(handle.token());
  if (!r)
    RAYBIND_LOG_WARN("releasing handles after a fatal error: {}",
                     r.error().describe());
  native = nullptr;
  dispatcher.attach(nullptr);
}

ScopedHandle Session::adopt(const Lock &lock, HandleKind kind,
                            const void *native_handle, HandleToken parent,
                            Closer closer) {
  auto &registry = runtime->registry();
  auto token = registry.register_handle(kind, native_handle, parent, closer);
  if (!token) {
    if (native_handle && closer) {
      StatusCode status(closer());
      if (!status.ok())
        RAYBIND_LOG_WARN("closing unregistered {} handle: status {}",
                         to_string(kind), status.raw());
    }
    dispatcher.record(token.error());
    raise(lock, std::move(token).error());
  }
  return ScopedHandle(registry, *token);
}

void Session::track(const std::shared_ptr<CursorCore> &cursor) {
  std::lock_guard<std::mutex> guard(children_mutex);
  std::erase_if(cursors, [](const auto &w) { return w.expired(); });
  cursors.push_back(cursor);
}

StatementCore::~StatementCore() {
  auto lock = session->dispatcher.serialize();
  state.store(CursorState::Closed);
  if (auto r = handle.release(); !r)
    RAYBIND_LOG_WARN("finalizing statement: {}", r.error().describe());
}

CursorCore::~CursorCore() {
  auto lock = session().dispatcher.serialize();
  if (state.load() != CursorState::Executing)
    return;
  if (auto r = finish(lock, CursorState::Closed); !r)
    RAYBIND_LOG_WARN("closing result set: {}", r.error().describe());
}

Result<void> CursorCore::finish(const Lock &, CursorState next) {
  const CursorState prev = state.exchange(next);
  pending.reset();
  auto r = handle.release();
  if (prev == CursorState::Executing &&
      statement->state.load() == CursorState::Executing)
    statement->state.store(CursorState::Prepared);
  if (!r)
    session().dispatcher.record(r.error());
  return r;
}

void CursorCore::check_open() const {
  switch (state.load()) {
  case CursorState::Executing:
    return;
  case CursorState::Exhausted:
    throw_error(make_error(ErrorKind::InvalidArgument,
                           "result set is exhausted"));
  default:
    throw_error(make_error(ErrorKind::InvalidArgument, "result set is closed"));
  }
}

std::optional<Table> CursorCore::next(const Lock &lock, size_t max_rows) {
  Session &s = session();
  auto batch = s.dispatcher.invoke_fetch(lock, native, max_rows, cancelled);
  if (!batch) {
    if (batch.error().kind == ErrorKind::Cancelled) {
      if (auto r = finish(lock, CursorState::Closed); !r)
        RAYBIND_LOG_WARN("closing cancelled result set: {}",
                         r.error().describe());
    }
    s.raise(lock, std::move(batch).error());
  }

  if (!*batch) {
    // An engine that ends without a first batch yields no columns.
    if (!layout)
      layout.emplace();
    s.unwrap(lock, finish(lock, CursorState::Exhausted));
    return std::nullopt;
  }

  Table &table = **batch;
  if (!layout) {
    layout = layout_of(table);
  } else if (layout_of(table) != *layout) {
    BindError err = make_error(ErrorKind::BindingInternal,
                               "result batches disagree on column layout");
    s.dispatcher.record(err);
    throw_error(std::move(err));
  }
  return std::move(table);
}

} // namespace detail

// ===========================================================================
// Connection
// ===========================================================================

Connection::Connection(std::shared_ptr<detail::Session> session) noexcept
    : session_(std::move(session)) {}

Connection::~Connection() = default;
Connection::Connection(Connection &&) noexcept = default;
Connection &Connection::operator=(Connection &&) noexcept = default;

detail::Session &Connection::session() const {
  if (!session_)
    throw_error(make_error(ErrorKind::InvalidArgument,
                           "connection object has been moved from"));
  return *session_;
}

Connection Connection::open(std::shared_ptr<Runtime> runtime,
                            ConnectOptions options) {
  if (!runtime)
    throw_error(make_error(ErrorKind::InvalidArgument, "runtime is null"));
  if (options.fetch_batch_rows == 0)
    throw_error(make_error(ErrorKind::InvalidArgument,
                           "fetch_batch_rows must be positive"));

  auto session =
      std::make_shared<detail::Session>(std::move(runtime), std::move(options));
  {
    auto lock = session->dispatcher.serialize();
    const EngineApi &api = session->dispatcher.api();
    ray_conn_t *conn = nullptr;
    session->unwrap(lock,
                    session->dispatcher.invoke(lock, EntryPoint::Open, [&] {
                      return api.open(session->options.uri.c_str(), &conn);
                    }));

    session->handle = session->adopt(
        lock, HandleKind::Connection, conn, INVALID_HANDLE,
        [close = api.close, conn] { return close(conn); });
    session->native = conn;
    session->dispatcher.attach(conn);
    session->state.store(ConnectionState::Open);
  }
  RAYBIND_LOG_INFO("connected to '{}'", session->options.uri.empty()
                                            ? "<in-process>"
                                            : session->options.uri);
  return Connection(std::move(session));
}

void Connection::close(bool force) {
  detail::Session &s = session();
  auto lock = s.dispatcher.serialize();
  if (!s.is_usable())
    return;

  auto &registry = s.runtime->registry();
  const HandleToken token = s.handle.token();
  if (size_t children = registry.live_children(token); children && !force)
    throw_error(make_error(
        ErrorKind::InvalidArgument,
        std::format("connection has {} live statements; close them first "
                    "or close with force",
                    children)));

  s.state.store(ConnectionState::Closed);
  Result<void> r =
      force ? registry.release_cascade(token) : s.handle.release();
  s.native = nullptr;
  s.dispatcher.attach(nullptr);
  RAYBIND_LOG_DEBUG("connection closed{}", force ? " (forced)" : "");
  if (!r) {
    s.dispatcher.record(r.error());
    if (r.error().fatal())
      s.dispatcher.poison(r.error());
    throw_error(std::move(r).error());
  }
}

bool Connection::is_open() const {
  return session_ && session_->is_usable();
}

ConnectionState Connection::state() const {
  return is_open() ? ConnectionState::Open : ConnectionState::Closed;
}

Statement Connection::prepare(std::string_view query) {
  detail::Session &s = session();
  auto core = std::make_shared<detail::StatementCore>(session_,
                                                      std::string(query));
  {
    auto lock = s.dispatcher.serialize();
    s.check(lock);
    const EngineApi &api = s.dispatcher.api();
    ray_stmt_t *stmt = nullptr;
    s.unwrap(lock, s.dispatcher.invoke(lock, EntryPoint::Prepare, [&] {
      return api.prepare(s.native, core->query.data(), core->query.size(),
                         &stmt);
    }));
    core->handle =
        s.adopt(lock, HandleKind::Statement, stmt, s.handle.token(),
                [finalize = api.finalize, stmt] { return finalize(stmt); });
    core->native = stmt;
    core->state.store(CursorState::Prepared);
  }
  RAYBIND_LOG_DEBUG("prepared statement: {}", core->query);
  return Statement(std::move(core));
}

Table Connection::execute(std::string_view query,
                          std::span<const Value> params) {
  Statement stmt = prepare(query);
  Table result = stmt.execute(params).fetch_all();
  stmt.close();
  return result;
}

void Connection::cancel() {
  detail::Session &s = session();
  std::vector<std::weak_ptr<detail::CursorCore>> cursors;
  {
    std::lock_guard<std::mutex> guard(s.children_mutex);
    cursors = s.cursors;
  }
  for (auto &w : cursors) {
    if (auto cursor = w.lock())
      cursor->cancelled.store(true, std::memory_order_release);
  }
}

std::optional<BindError> Connection::last_error() const {
  return session().dispatcher.last_error();
}

size_t Connection::live_children() const {
  detail::Session &s = session();
  if (!s.is_usable())
    return 0;
  return s.runtime->registry().live_children(s.handle.token());
}

const ConnectOptions &Connection::options() const {
  return session().options;
}

// ===========================================================================
// Statement
// ===========================================================================

Statement::Statement(std::shared_ptr<detail::StatementCore> core) noexcept
    : core_(std::move(core)) {}

Statement::~Statement() = default;
Statement::Statement(Statement &&) noexcept = default;
Statement &Statement::operator=(Statement &&) noexcept = default;

detail::StatementCore &Statement::core() const {
  if (!core_)
    throw_error(make_error(ErrorKind::InvalidArgument,
                           "statement object has been moved from"));
  return *core_;
}

ResultSet Statement::execute(std::span<const Value> params) {
  detail::StatementCore &st = core();
  detail::Session &s = *st.session;
  auto cursor = std::make_shared<detail::CursorCore>(core_);
  {
    auto lock = s.dispatcher.serialize();
    s.check(lock);
    switch (st.state.load()) {
    case CursorState::Prepared:
      break;
    case CursorState::Executing:
      throw_error(make_error(ErrorKind::InvalidArgument,
                             "statement has an open result set; exhaust or "
                             "close it first"));
    default:
      throw_error(make_error(ErrorKind::InvalidArgument, "statement is closed"));
    }

    const EngineApi &api = s.dispatcher.api();
    ray_cursor_t *cur = nullptr;
    s.unwrap(lock,
             s.dispatcher.invoke_with(
                 lock, EntryPoint::Execute, params,
                 [&](const ray_value_t *args, size_t count) {
                   return api.execute(st.native, args, count, &cur);
                 }));
    cursor->handle = s.adopt(
        lock, HandleKind::Cursor, cur, st.handle.token(),
        [close = api.close_cursor, cur] { return close(cur); });
    cursor->native = cur;
    cursor->state.store(CursorState::Executing);
    st.state.store(CursorState::Executing);
  }
  s.track(cursor);
  return ResultSet(std::move(cursor));
}

void Statement::close() {
  detail::StatementCore &st = core();
  detail::Session &s = *st.session;
  auto lock = s.dispatcher.serialize();
  if (st.state.load() == CursorState::Closed)
    return;
  if (!s.is_usable()) {
    // Handles were released with the connection.
    st.state.store(CursorState::Closed);
    return;
  }
  if (st.state.load() == CursorState::Executing)
    throw_error(make_error(ErrorKind::InvalidArgument,
                           "statement has an open result set"));
  st.state.store(CursorState::Closed);
  s.unwrap(lock, st.handle.release());
}

CursorState Statement::state() const {
  detail::StatementCore &st = core();
  return st.session->is_usable() ? st.state.load() : CursorState::Closed;
}

const std::string &Statement::query() const { return core().query; }

// ===========================================================================
// ResultSet
// ===========================================================================

ResultSet::ResultSet(std::shared_ptr<detail::CursorCore> core) noexcept
    : core_(std::move(core)) {}

ResultSet::~ResultSet() = default;
ResultSet::ResultSet(ResultSet &&) noexcept = default;
ResultSet &ResultSet::operator=(ResultSet &&) noexcept = default;

detail::CursorCore &ResultSet::core() const {
  if (!core_)
    throw_error(make_error(ErrorKind::InvalidArgument,
                           "result set object has been moved from"));
  return *core_;
}

std::optional<Table> ResultSet::fetch_batch(size_t max_rows) {
  detail::CursorCore &cur = core();
  detail::Session &s = cur.session();
  auto lock = s.dispatcher.serialize();
  s.check(lock);
  cur.check_open();
  if (cur.pending && !cur.cancelled.load(std::memory_order_acquire)) {
    std::optional<Table> first = std::move(cur.pending);
    cur.pending.reset();
    return first;
  }
  return cur.next(lock, max_rows ? max_rows : s.options.fetch_batch_rows);
}

Table ResultSet::fetch_all() {
  detail::CursorCore &cur = core();
  detail::Session &s = cur.session();
  auto lock = s.dispatcher.serialize();
  s.check(lock);
  cur.check_open();

  std::optional<Table> all = std::move(cur.pending);
  cur.pending.reset();
  while (auto batch = cur.next(lock, s.options.fetch_batch_rows)) {
    if (!all)
      all = std::move(*batch);
    else
      s.unwrap(lock, all->append(*batch));
  }
  return all ? std::move(*all) : Table();
}

std::vector<ColumnInfo> ResultSet::columns() {
  detail::CursorCore &cur = core();
  detail::Session &s = cur.session();
  auto lock = s.dispatcher.serialize();
  s.check(lock);
  cur.check_open();
  if (cur.layout)
    return *cur.layout;
  if (auto batch = cur.next(lock, s.options.fetch_batch_rows))
    cur.pending = std::move(batch);
  return cur.layout.value_or(std::vector<ColumnInfo>{});
}

void ResultSet::cancel() noexcept {
  if (core_)
    core_->cancelled.store(true, std::memory_order_release);
}

void ResultSet::close() {
  detail::CursorCore &cur = core();
  detail::Session &s = cur.session();
  auto lock = s.dispatcher.serialize();
  if (cur.state.load() != CursorState::Executing) {
    cur.state.store(CursorState::Closed);
    return;
  }
  if (!s.is_usable()) {
    if (auto r = cur.finish(lock, CursorState::Closed); !r)
      RAYBIND_LOG_WARN("closing result set: {}", r.error().describe());
    return;
  }
  s.unwrap(lock, cur.finish(lock, CursorState::Closed));
}

CursorState ResultSet::state() const {
  detail::CursorCore &cur = core();
  return cur.session().is_usable() ? cur.state.load() : CursorState::Closed;
}

} // namespace raybind
