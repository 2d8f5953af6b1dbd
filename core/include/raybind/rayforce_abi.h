/**
 * @file rayforce_abi.h
 * @brief Pinned C contract between the binding layer and librayforce.
 *
 * The binding layer never relies on implicit declarations or best-effort
 * symbol lookup. Every entry point it consumes is declared here with an
 * explicit signature, and the engine reports the contract revision it was
 * built against through ray_abi_version(). A library whose revision differs
 * from RAYFORCE_ABI_VERSION is rejected at load time.
 *
 * CONTRACT INVARIANTS:
 *   1. All functions are `extern "C"` with default visibility.
 *   2. Every function except ray_abi_version() returns a ray_status_t.
 *   3. Handles (ray_conn_t, ray_stmt_t, ray_cursor_t) are opaque and are
 *      released exactly once through their matching close entry point.
 *   4. Result batches returned by ray_fetch() are engine-owned until passed
 *      to ray_free_result(). The caller only reads them.
 *   5. Parameter descriptors passed to ray_execute() are caller-owned and
 *      only valid for the duration of the call.
 */

#ifndef RAYFORCE_ABI_H
#define RAYFORCE_ABI_H

#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32) || defined(_WIN64)
#ifdef RAYFORCE_BUILDING_SHARED
#define RAY_API __declspec(dllexport)
#else
#define RAY_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define RAY_API __attribute__((visibility("default")))
#else
#define RAY_API
#endif

/** Contract revision. Bumped on any layout or signature change. */
#define RAYFORCE_ABI_VERSION 2u

#ifdef __cplusplus
extern "C" {
#endif

/* ═══════════════════════════════════════════════════════════════════════════
 * STATUS CODES - ray_status_t
 *
 *   0            Ok
 *   -(code)      recoverable error, code in the low byte
 *   -(code|0x100) fatal error; the handle the call was issued through (and
 *                its connection) must not be used again
 * ═══════════════════════════════════════════════════════════════════════════
 */
typedef int32_t ray_status_t;

#define RAY_OK 0
#define RAY_FATAL_FLAG 0x100
#define RAY_STATUS(code) ((ray_status_t)(-(int32_t)(code)))
#define RAY_STATUS_FATAL(code)                                                 \
  ((ray_status_t)(-(int32_t)((code) | RAY_FATAL_FLAG)))

/** Engine error codes (low byte of a failing status). */
typedef enum {
  RAY_EC_TYPE = 1,       /**< Type mismatch */
  RAY_EC_ARITY = 2,      /**< Wrong number of arguments */
  RAY_EC_LENGTH = 3,     /**< List length mismatch */
  RAY_EC_DOMAIN = 4,     /**< Value out of range */
  RAY_EC_INDEX = 5,      /**< Index out of bounds */
  RAY_EC_VALUE = 6,      /**< Undefined symbol / object */
  RAY_EC_LIMIT = 7,      /**< Resource limit reached */
  RAY_EC_OS = 8,         /**< System error (wraps errno) */
  RAY_EC_PARSE = 9,      /**< Query parse error */
  RAY_EC_NYI = 10,       /**< Not yet implemented */
  RAY_EC_USER = 11,      /**< User raised */
  RAY_EC_CANCELLED = 12, /**< Operation cancelled by the engine */
  RAY_EC_INTERNAL = 13,  /**< Engine invariant violated */
  RAY_EC_NOMEM = 14,     /**< Allocation failed */
  RAY_EC_HANDLE = 15     /**< Invalid or misused handle */
} ray_errc_t;

/* ═══════════════════════════════════════════════════════════════════════════
 * VALUE DESCRIPTORS - ray_value_t
 *
 * Atoms carry a negative type tag, vectors the positive one. RAY_TYPE_NULL
 * is an atom only. The three container tags are positive only:
 *
 *   RAY_TYPE_LIST   `len` items of any shape in `children`
 *   RAY_TYPE_TABLE  `len` columns in `children`, named by `names`; every
 *                   column is a vector and all columns have the same length
 *   RAY_TYPE_DICT   `len` entries; children[0] holds the keys and
 *                   children[1] the values, each a vector or list of `len`
 * ═══════════════════════════════════════════════════════════════════════════
 */
typedef enum {
  RAY_TYPE_NULL = 0,
  RAY_TYPE_B8 = 1,        /**< uint8_t, 0 or 1 */
  RAY_TYPE_U8 = 2,        /**< uint8_t */
  RAY_TYPE_I16 = 3,       /**< int16_t */
  RAY_TYPE_I32 = 4,       /**< int32_t */
  RAY_TYPE_I64 = 5,       /**< int64_t */
  RAY_TYPE_F32 = 6,       /**< float */
  RAY_TYPE_F64 = 7,       /**< double */
  RAY_TYPE_TIMESTAMP = 8, /**< int64_t nanoseconds since the Unix epoch */
  RAY_TYPE_STR = 9,       /**< UTF-8 text, see ray_str_encoding_t */
  RAY_TYPE_BYTES = 10,    /**< opaque bytes, see ray_str_encoding_t */
  RAY_TYPE_DATE = 11,     /**< int32_t days since 1970-01-01 */
  RAY_TYPE_TIME = 12,     /**< int32_t milliseconds since midnight */
  RAY_TYPE_GUID = 13,     /**< 16 bytes, RFC 4122 byte order */
  RAY_TYPE_SYMBOL = 14,   /**< interned UTF-8 name, laid out like STR */
  RAY_TYPE_C8 = 15,       /**< one byte character */
  RAY_TYPE_LIST = 97,
  RAY_TYPE_TABLE = 98,
  RAY_TYPE_DICT = 99
} ray_type_t;

/**
 * Layout of variable-width payloads (RAY_TYPE_STR, RAY_TYPE_SYMBOL and
 * RAY_TYPE_BYTES).
 * An atom is laid out as a vector of one element.
 */
typedef enum {
  /** Each element: little-endian uint32_t byte length, then the bytes. */
  RAY_STR_LENGTH_PREFIXED = 1,
  /** Each element: the bytes, then a single '\0'. */
  RAY_STR_NUL_TERMINATED = 2
} ray_str_encoding_t;

typedef struct ray_value_s ray_value_t;

struct ray_value_s {
  int8_t type;         /**< ray_type_t, negated for atoms */
  uint8_t encoding;    /**< ray_str_encoding_t for STR/SYMBOL/BYTES, else 0 */
  uint8_t reserved[6]; /**< Must be zero */
  int64_t len;         /**< Element, item, column or entry count */
  union {
    uint8_t b8;
    uint8_t u8;
    int16_t i16;
    int32_t i32;
    int64_t i64;
    float f32;
    double f64;
    int32_t date;
    int32_t time;
    char c8;
    uint8_t guid[16];
  } atom;                   /**< Fixed-width atom payload */
  const void *data;         /**< Vector payload, or encoded variable atom */
  size_t data_bytes;        /**< Size of `data` in bytes */
  const uint8_t *validity;  /**< Vectors: bit i (LSB first) set = valid.
                                 NULL = every element valid */
  const char *const *names; /**< Table: `len` NUL-terminated column names */
  const ray_value_t *children; /**< List items, table columns, dict halves */
};

/* ═══════════════════════════════════════════════════════════════════════════
 * OPAQUE HANDLES
 * ═══════════════════════════════════════════════════════════════════════════
 */
typedef struct ray_conn_s ray_conn_t;
typedef struct ray_stmt_s ray_stmt_t;
typedef struct ray_cursor_s ray_cursor_t;

/* ═══════════════════════════════════════════════════════════════════════════
 * PROCESS LIFECYCLE
 * ═══════════════════════════════════════════════════════════════════════════
 */

/** @brief Contract revision the engine was built against. */
RAY_API uint32_t ray_abi_version(void);

/**
 * @brief Initializes process-wide engine state. Reference counted: every
 *        successful call is paired with one ray_runtime_shutdown().
 */
RAY_API ray_status_t ray_runtime_init(uint32_t flags);

/** @brief Releases process-wide engine state. */
RAY_API ray_status_t ray_runtime_shutdown(void);

/* ═══════════════════════════════════════════════════════════════════════════
 * CONNECTION
 * ═══════════════════════════════════════════════════════════════════════════
 */

/**
 * @param[in]  uri      NUL-terminated connection string ("" = in-process).
 * @param[out] out_conn Receives the connection handle.
 */
RAY_API ray_status_t ray_open(const char *uri, ray_conn_t **out_conn);

/** @brief Closes a connection. Statements and cursors must be gone first. */
RAY_API ray_status_t ray_close(ray_conn_t *conn);

/**
 * @brief Copies the last error text recorded for `conn` into `buf`.
 *
 * `conn` may be NULL to read the process-level error left by a failed
 * ray_open(). The text is truncated to `capacity - 1` bytes and always
 * NUL-terminated when capacity > 0; `out_len` receives the full length.
 */
RAY_API ray_status_t ray_last_error(ray_conn_t *conn, char *buf,
                                    size_t capacity, size_t *out_len);

/* ═══════════════════════════════════════════════════════════════════════════
 * STATEMENT / CURSOR
 * ═══════════════════════════════════════════════════════════════════════════
 */

RAY_API ray_status_t ray_prepare(ray_conn_t *conn, const char *query,
                                 size_t query_len, ray_stmt_t **out_stmt);

RAY_API ray_status_t ray_finalize(ray_stmt_t *stmt);

/**
 * @param[in]  params      `param_count` caller-owned descriptors.
 * @param[out] out_cursor  Receives the result cursor.
 */
RAY_API ray_status_t ray_execute(ray_stmt_t *stmt, const ray_value_t *params,
                                 size_t param_count, ray_cursor_t **out_cursor);

/**
 * @brief Fetches the next batch of at most `max_rows` rows as a table.
 *
 * The first fetch of a result always yields a batch (possibly with zero
 * rows) so the column layout is known. `*out_batch` is set to NULL once the
 * cursor is exhausted.
 */
RAY_API ray_status_t ray_fetch(ray_cursor_t *cursor, size_t max_rows,
                               ray_value_t **out_batch);

/** @brief Returns an engine-owned batch to the engine. */
RAY_API ray_status_t ray_free_result(ray_value_t *batch);

RAY_API ray_status_t ray_close_cursor(ray_cursor_t *cursor);

/* ═══════════════════════════════════════════════════════════════════════════
 * FUNCTION POINTER TYPES - used for dynamic resolution
 * ═══════════════════════════════════════════════════════════════════════════
 */
typedef uint32_t (*ray_abi_version_fn)(void);
typedef ray_status_t (*ray_runtime_init_fn)(uint32_t);
typedef ray_status_t (*ray_runtime_shutdown_fn)(void);
typedef ray_status_t (*ray_open_fn)(const char *, ray_conn_t **);
typedef ray_status_t (*ray_close_fn)(ray_conn_t *);
typedef ray_status_t (*ray_last_error_fn)(ray_conn_t *, char *, size_t,
                                          size_t *);
typedef ray_status_t (*ray_prepare_fn)(ray_conn_t *, const char *, size_t,
                                       ray_stmt_t **);
typedef ray_status_t (*ray_finalize_fn)(ray_stmt_t *);
typedef ray_status_t (*ray_execute_fn)(ray_stmt_t *, const ray_value_t *,
                                       size_t, ray_cursor_t **);
typedef ray_status_t (*ray_fetch_fn)(ray_cursor_t *, size_t, ray_value_t **);
typedef ray_status_t (*ray_free_result_fn)(ray_value_t *);
typedef ray_status_t (*ray_close_cursor_fn)(ray_cursor_t *);

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* RAYFORCE_ABI_H */
