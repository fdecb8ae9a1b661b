#include "vexlake/c/vexlake.h"

#include <algorithm>
#include <memory>
#include <new>
#include <span>
#include <string>

#include "vexlake/engine.hpp"
#include "vexlake/error_mapping.hpp"

struct vexlake_engine_t {
  std::unique_ptr<vexlake::Engine> engine;
};

#include "vexlake_c_error.hpp"

thread_local std::string vexlake_c::g_last_error;
using vexlake_c::set_error;
using vexlake_c::clear_error;

namespace {

vexlake_status_t report(const vexlake::core::error& e) {
  set_error(e.component.empty() ? e.message : e.component + ": " + e.message);
  return vexlake::core::to_c_status(e.code);
}

vexlake_status_t invalid(const char* what) {
  set_error(what);
  return VEXLAKE_E_INVALID_ARGUMENT;
}

} // namespace

extern "C" {

VEXLAKE_C_API const char* vexlake_get_last_error(void) {
  return vexlake_c::g_last_error.empty() ? "" : vexlake_c::g_last_error.c_str();
}

VEXLAKE_C_API const char* vexlake_version(void) {
  return vexlake::version();
}

VEXLAKE_C_API vexlake_status_t vexlake_open(const vexlake_open_params_t* params, vexlake_engine_t** out_engine) {
  if (!params || !out_engine || !params->root) return invalid("params, params->root and out_engine are required");
  clear_error();
  *out_engine = nullptr;
  try {
    vexlake::EngineConfig cfg;
    cfg.root = params->root;
    if (params->wal_dir) cfg.wal_dir = params->wal_dir;
    cfg.dimension = params->dimension;
    switch (params->metric) {
      case VEXLAKE_METRIC_L2: cfg.metric = vexlake::kernels::Metric::L2; break;
      case VEXLAKE_METRIC_INNER_PRODUCT: cfg.metric = vexlake::kernels::Metric::InnerProduct; break;
      case VEXLAKE_METRIC_COSINE: cfg.metric = vexlake::kernels::Metric::Cosine; break;
      default: return invalid("unknown metric");
    }
    if (params->default_ef) cfg.default_ef = params->default_ef;
    if (params->flush_threshold_bytes) cfg.flush_threshold_bytes = params->flush_threshold_bytes;
    if (auto r = vexlake::apply_env_overrides(cfg); !r) return report(r.error());

    auto engine = vexlake::Engine::open(cfg);
    if (!engine) return report(engine.error());
    auto* handle = new (std::nothrow) vexlake_engine_t{std::move(*engine)};
    if (!handle) {
      set_error("out of memory");
      return VEXLAKE_E_INTERNAL;
    }
    *out_engine = handle;
    return VEXLAKE_OK;
  } catch (const std::exception& e) {
    set_error(e.what());
    return VEXLAKE_E_INTERNAL;
  } catch (...) {
    set_error("unknown error in open");
    return VEXLAKE_E_INTERNAL;
  }
}

VEXLAKE_C_API vexlake_status_t vexlake_close(vexlake_engine_t* engine) {
  if (!engine) return VEXLAKE_OK;
  clear_error();
  vexlake_status_t st = VEXLAKE_OK;
  try {
    if (engine->engine) {
      if (auto r = engine->engine->shutdown(); !r) st = report(r.error());
    }
  } catch (const std::exception& e) {
    set_error(e.what());
    st = VEXLAKE_E_INTERNAL;
  }
  delete engine;
  return st;
}

VEXLAKE_C_API int vexlake_health_check(const vexlake_engine_t* engine) {
  return engine && engine->engine && engine->engine->health_check() ? 1 : 0;
}

VEXLAKE_C_API vexlake_status_t vexlake_insert(vexlake_engine_t* engine, uint64_t id, const float* vector, size_t dim,
                                              const uint8_t* payload, size_t payload_len) {
  if (!engine || !engine->engine || !vector) return invalid("engine and vector are required");
  if (payload_len && !payload) return invalid("payload is NULL but payload_len > 0");
  clear_error();
  try {
    auto r = engine->engine->insert(id, std::span<const float>(vector, dim),
                                    std::span<const std::uint8_t>(payload, payload_len));
    return r ? VEXLAKE_OK : report(r.error());
  } catch (const std::exception& e) {
    set_error(e.what());
    return VEXLAKE_E_INTERNAL;
  }
}

VEXLAKE_C_API vexlake_status_t vexlake_delete(vexlake_engine_t* engine, uint64_t id) {
  if (!engine || !engine->engine) return invalid("engine is required");
  clear_error();
  try {
    auto r = engine->engine->remove(id);
    return r ? VEXLAKE_OK : report(r.error());
  } catch (const std::exception& e) {
    set_error(e.what());
    return VEXLAKE_E_INTERNAL;
  }
}

VEXLAKE_C_API vexlake_status_t vexlake_search(vexlake_engine_t* engine, const float* query, size_t dim, uint32_t k,
                                              uint32_t ef, uint64_t* out_ids, float* out_scores, size_t* out_count) {
  if (!engine || !engine->engine || !query || !out_ids || !out_scores || !out_count) {
    return invalid("engine, query and output arrays are required");
  }
  clear_error();
  *out_count = 0;
  try {
    auto r = engine->engine->search(std::span<const float>(query, dim), k, ef);
    if (!r) return report(r.error());
    const std::size_t n = std::min<std::size_t>(k, r->size());
    for (std::size_t i = 0; i < n; ++i) {
      out_ids[i] = (*r)[i].id;
      out_scores[i] = (*r)[i].score;
    }
    *out_count = n;
    return VEXLAKE_OK;
  } catch (const std::exception& e) {
    set_error(e.what());
    return VEXLAKE_E_INTERNAL;
  }
}

VEXLAKE_C_API vexlake_status_t vexlake_flush(vexlake_engine_t* engine, uint64_t* out_version) {
  if (!engine || !engine->engine) return invalid("engine is required");
  clear_error();
  try {
    auto r = engine->engine->flush();
    if (!r) return report(r.error());
    if (out_version) *out_version = *r;
    return VEXLAKE_OK;
  } catch (const std::exception& e) {
    set_error(e.what());
    return VEXLAKE_E_INTERNAL;
  }
}

} // extern "C"
