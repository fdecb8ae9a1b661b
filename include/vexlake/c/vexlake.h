#pragma once

#ifdef __cplusplus
extern "C" {
#endif

// Symbol visibility
#if defined(_WIN32)
  #if defined(VEXLAKE_C_API_EXPORTS)
    #define VEXLAKE_C_API __declspec(dllexport)
  #else
    #define VEXLAKE_C_API __declspec(dllimport)
  #endif
#else
  #define VEXLAKE_C_API __attribute__((visibility("default")))
#endif

#include <stddef.h>
#include <stdint.h>

// Opaque handle
typedef struct vexlake_engine_t vexlake_engine_t;

typedef enum vexlake_status_e {
  VEXLAKE_OK = 0,
  VEXLAKE_E_INVALID_ARGUMENT = 1,
  VEXLAKE_E_DIMENSION_MISMATCH = 2,
  VEXLAKE_E_NOT_INITIALIZED = 3,
  VEXLAKE_E_NOT_FOUND = 4,
  VEXLAKE_E_ALREADY_EXISTS = 5,
  VEXLAKE_E_UNAVAILABLE = 6,
  VEXLAKE_E_DURABILITY = 7,
  VEXLAKE_E_DATA_INTEGRITY = 8,
  VEXLAKE_E_CANCELLED = 9,
  VEXLAKE_E_CONFIG_INVALID = 10,
  VEXLAKE_E_IO = 11,
  VEXLAKE_E_INTERNAL = 12
} vexlake_status_t;

typedef enum vexlake_metric_e {
  VEXLAKE_METRIC_L2 = 0,
  VEXLAKE_METRIC_INNER_PRODUCT = 1,
  VEXLAKE_METRIC_COSINE = 2
} vexlake_metric_t;

typedef struct vexlake_open_params_s {
  const char* root;               // storage namespace directory
  const char* wal_dir;            // NULL = <root>/_wal
  uint32_t dimension;
  vexlake_metric_t metric;
  uint32_t default_ef;            // 0 = library default
  size_t flush_threshold_bytes;   // 0 = library default
} vexlake_open_params_t;

// Thread-local last error string
VEXLAKE_C_API const char* vexlake_get_last_error(void);

// Version info (semantic version string, e.g. "0.3.0")
VEXLAKE_C_API const char* vexlake_version(void);

// Lifecycle. VEXLAKE_* environment variables are applied on top of params.
VEXLAKE_C_API vexlake_status_t vexlake_open(const vexlake_open_params_t* params, vexlake_engine_t** out_engine);
// Flushes buffered writes and releases the engine (NULL is a no-op).
VEXLAKE_C_API vexlake_status_t vexlake_close(vexlake_engine_t* engine);
VEXLAKE_C_API int vexlake_health_check(const vexlake_engine_t* engine);

VEXLAKE_C_API vexlake_status_t vexlake_insert(
  vexlake_engine_t* engine,
  uint64_t id,
  const float* vector,            // size: dim
  size_t dim,
  const uint8_t* payload,         // may be NULL when payload_len == 0
  size_t payload_len);

VEXLAKE_C_API vexlake_status_t vexlake_delete(vexlake_engine_t* engine, uint64_t id);

// Top-k search. ef == 0 uses the configured default; ef < k is raised to k.
// Writes up to k results; *out_count receives the number written.
VEXLAKE_C_API vexlake_status_t vexlake_search(
  vexlake_engine_t* engine,
  const float* query,             // size: dim
  size_t dim,
  uint32_t k,
  uint32_t ef,
  uint64_t* out_ids,              // size: k
  float* out_scores,              // size: k
  size_t* out_count);

// Drains buffered writes; *out_version (optional) receives the current version id.
VEXLAKE_C_API vexlake_status_t vexlake_flush(vexlake_engine_t* engine, uint64_t* out_version);

#ifdef __cplusplus
} // extern "C"
#endif
