#pragma once

/**
 * @file session.hpp
 * @brief Session/Connection façade: Connection, Statement and ResultSet.
 *
 * The public API of raybind. Every operation either returns a fully
 * marshalled value or throws raybind::Error; no partially populated
 * results are ever returned.
 *
 * Lifecycle:
 *   Connection  Closed -> Open -> Closed (close() or a fatal error)
 *   Statement   Unprepared -> Prepared -> Executing -> Prepared ... Closed
 *   ResultSet   Executing -> Exhausted -> Closed
 *
 * A Statement is Executing while one of its result sets is open and goes
 * back to Prepared when that result set is exhausted or closed. Operations
 * on a Closed or Exhausted object throw InvalidArgument; after a fatal error
 * they rethrow that error instead.
 *
 * Wrappers are move-only handles onto shared state: the native handle is
 * released when the last wrapper referencing it goes away. Children keep
 * their parent alive.
 *
 * Thread-safety: all calls through one connection (and its statements and
 * result sets) are serialized. cancel() never blocks on an in-flight call.
 */

#include "raybind/dispatcher.hpp"
#include "raybind/engine.hpp"
#include "raybind/error.hpp"
#include "raybind/marshal.hpp"
#include "raybind/value.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace raybind {

struct ConnectOptions {
  /// Engine connection string; empty means in-process.
  std::string uri;
  /// Rows per ray_fetch() when no explicit batch size is given.
  size_t fetch_batch_rows = 1024;
  /// Layout used for string and bytes parameters.
  StringEncoding string_encoding = StringEncoding::LengthPrefixed;
};

enum class ConnectionState : uint8_t { Closed, Open };

enum class CursorState : uint8_t {
  Unprepared,
  Prepared,
  Executing,
  Exhausted,
  Closed
};

std::string_view to_string(ConnectionState state) noexcept;
std::string_view to_string(CursorState state) noexcept;

struct ColumnInfo {
  std::string name;
  ElementType type;

  bool operator==(const ColumnInfo &) const = default;
};

namespace detail {
struct Session;
struct StatementCore;
struct CursorCore;
} // namespace detail

class Statement;
class ResultSet;

// ===========================================================================
// Connection
// ===========================================================================

class Connection {
public:
  /// Open a connection through `runtime`. Throws on failure.
  static Connection open(std::shared_ptr<Runtime> runtime,
                         ConnectOptions options = {});

  ~Connection();
  Connection(Connection &&) noexcept;
  Connection &operator=(Connection &&) noexcept;
  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  /**
   * @brief Close the connection.
   * @param force  Close live statements and result sets first. Without it,
   *               live children make close() throw InvalidArgument.
   *
   * Closing a closed connection is a no-op.
   */
  void close(bool force = false);

  bool is_open() const;
  ConnectionState state() const;

  Statement prepare(std::string_view query);

  /// prepare + execute + fetch_all, releasing the statement afterwards.
  Table execute(std::string_view query, std::span<const Value> params = {});

  /// Cancel every open result set of this connection.
  void cancel();

  /// Most recent failure seen on this connection.
  std::optional<BindError> last_error() const;

  /// Live statements and result sets.
  size_t live_children() const;

  const ConnectOptions &options() const;

private:
  explicit Connection(std::shared_ptr<detail::Session> session) noexcept;
  detail::Session &session() const;

  std::shared_ptr<detail::Session> session_;
};

// ===========================================================================
// Statement
// ===========================================================================

class Statement {
public:
  ~Statement();
  Statement(Statement &&) noexcept;
  Statement &operator=(Statement &&) noexcept;
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  /// Throws InvalidArgument while another result set of this statement is
  /// open.
  ResultSet execute(std::span<const Value> params = {});

  /// Release the native statement. Throws if a result set is still open.
  void close();

  CursorState state() const;
  const std::string &query() const;

private:
  friend class Connection;
  explicit Statement(std::shared_ptr<detail::StatementCore> core) noexcept;
  detail::StatementCore &core() const;

  std::shared_ptr<detail::StatementCore> core_;
};

// ===========================================================================
// ResultSet
// ===========================================================================

class ResultSet {
public:
  ~ResultSet();
  ResultSet(ResultSet &&) noexcept;
  ResultSet &operator=(ResultSet &&) noexcept;
  ResultSet(const ResultSet &) = delete;
  ResultSet &operator=(const ResultSet &) = delete;

  /**
   * @brief Next batch of at most `max_rows` rows (0: the connection's
   *        fetch_batch_rows).
   * @return std::nullopt when the result is exhausted; the cursor is
   *         released at that point.
   */
  std::optional<Table> fetch_batch(size_t max_rows = 0);

  /// Every remaining row as one table. The result set is exhausted after.
  Table fetch_all();

  /// Column names and types. May fetch the first batch to learn them.
  std::vector<ColumnInfo> columns();

  /// Never blocks. An in-flight fetch finishes, its batch is discarded and
  /// it throws Cancelled; the result set is closed.
  void cancel() noexcept;

  void close();

  CursorState state() const;

private:
  friend class Statement;
  explicit ResultSet(std::shared_ptr<detail::CursorCore> core) noexcept;
  detail::CursorCore &core() const;

  std::shared_ptr<detail::CursorCore> core_;
};

} // namespace raybind
