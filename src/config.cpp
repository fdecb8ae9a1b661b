#include "vexlake/config.hpp"

#include <charconv>

#include "vexlake/core/platform_utils.hpp"

namespace vexlake {

namespace {

auto invalid(const std::string& msg) -> std::unexpected<core::error> {
    return core::fail(core::error_code::config_invalid, msg, "config");
}

template <typename T>
auto env_number(const char* name, T& out) -> std::expected<void, core::error> {
    auto v = core::safe_getenv(name);
    if (!v || v->empty()) return {};
    T parsed{};
    auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), parsed);
    if (ec != std::errc{} || ptr != v->data() + v->size()) {
        return invalid(std::string(name) + "='" + *v + "' is not a number");
    }
    out = parsed;
    return {};
}

auto env_bool(const char* name, bool& out) -> std::expected<void, core::error> {
    auto v = core::safe_getenv(name);
    if (!v || v->empty()) return {};
    if (*v == "1" || *v == "true" || *v == "on") {
        out = true;
    } else if (*v == "0" || *v == "false" || *v == "off") {
        out = false;
    } else {
        return invalid(std::string(name) + "='" + *v + "' is not a boolean");
    }
    return {};
}

} // namespace

auto apply_env_overrides(EngineConfig& cfg) -> std::expected<void, core::error> {
    if (auto v = core::safe_getenv("VEXLAKE_ROOT"); v && !v->empty()) cfg.root = *v;
    if (auto v = core::safe_getenv("VEXLAKE_WAL_DIR"); v && !v->empty()) cfg.wal_dir = *v;
    if (auto v = core::safe_getenv("VEXLAKE_METRIC"); v && !v->empty()) {
        auto m = kernels::parse_metric(*v);
        if (!m) return invalid("VEXLAKE_METRIC='" + *v + "' is not l2, ip or cosine");
        cfg.metric = *m;
    }
    if (auto v = core::safe_getenv("VEXLAKE_KERNEL_BACKEND"); v && !v->empty()) cfg.kernel_backend = *v;

    std::int64_t interval_ms = cfg.compaction.interval.count();
    std::int64_t timeout_ms = cfg.query_timeout.count();
    std::uint32_t max_attempts = cfg.retry.max_attempts;
    const std::expected<void, core::error> steps[] = {
        env_number("VEXLAKE_DIMENSION", cfg.dimension),
        env_number("VEXLAKE_FLUSH_THRESHOLD_BYTES", cfg.flush_threshold_bytes),
        env_number("VEXLAKE_DEFAULT_EF", cfg.default_ef),
        env_number("VEXLAKE_HNSW_M", cfg.hnsw.M),
        env_number("VEXLAKE_HNSW_EF_CONSTRUCTION", cfg.hnsw.efConstruction),
        env_number("VEXLAKE_PARTITION", cfg.partition),
        env_number("VEXLAKE_SEARCH_THREADS", cfg.search_threads),
        env_number("VEXLAKE_COMPACTION_INTERVAL_MS", interval_ms),
        env_number("VEXLAKE_COMPACTION_MIN_FILES", cfg.compaction.min_files),
        env_number("VEXLAKE_QUERY_TIMEOUT_MS", timeout_ms),
        env_number("VEXLAKE_STORAGE_MAX_ATTEMPTS", max_attempts),
        env_bool("VEXLAKE_SYNC_WAL", cfg.sync_wal),
        env_bool("VEXLAKE_BACKGROUND_COMPACTION", cfg.background_compaction),
    };
    for (const auto& s : steps) {
        if (!s) return s;
    }
    cfg.compaction.interval = std::chrono::milliseconds(interval_ms);
    cfg.query_timeout = std::chrono::milliseconds(timeout_ms);
    cfg.retry.max_attempts = max_attempts;
    if (auto v = core::safe_getenv("VEXLAKE_HNSW_M"); v && !v->empty()) cfg.hnsw.max_M0 = 2 * cfg.hnsw.M;
    return {};
}

auto validate(const EngineConfig& cfg) -> std::expected<void, core::error> {
    if (cfg.root.empty()) return invalid("root must be set");
    if (cfg.dimension == 0) return invalid("dimension must be > 0");
    if (cfg.hnsw.M < 2) return invalid("hnsw M must be >= 2");
    if (cfg.hnsw.max_M0 < cfg.hnsw.M) return invalid("hnsw max_M0 must be >= M");
    if (cfg.hnsw.efConstruction < cfg.hnsw.M) return invalid("hnsw efConstruction must be >= M");
    if (cfg.default_ef == 0) return invalid("default_ef must be > 0");
    if (cfg.flush_threshold_bytes == 0) return invalid("flush_threshold_bytes must be > 0");
    if (cfg.retry.max_attempts == 0) return invalid("retry max_attempts must be >= 1");
    if (cfg.retry.base_delay.count() < 0 || cfg.retry.max_delay < cfg.retry.base_delay) {
        return invalid("retry delays must satisfy 0 <= base <= cap");
    }
    if (cfg.compaction.interval.count() <= 0) return invalid("compaction interval must be > 0");
    if (cfg.compaction.min_files < 2) return invalid("compaction min_files must be >= 2");
    if (cfg.compaction.target_rows == 0) return invalid("compaction target_rows must be > 0");
    if (cfg.compaction.tombstone_ratio <= 0.0 || cfg.compaction.tombstone_ratio > 1.0) {
        return invalid("compaction tombstone_ratio must be in (0, 1]");
    }
    if (cfg.query_timeout.count() < 0) return invalid("query_timeout must be >= 0");
    if (cfg.kernel_backend != "auto" && cfg.kernel_backend != "scalar" && cfg.kernel_backend != "avx2") {
        return invalid("kernel_backend must be auto, scalar or avx2");
    }
    return {};
}

} // namespace vexlake
