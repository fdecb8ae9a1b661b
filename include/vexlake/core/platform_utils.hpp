#pragma once

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace vexlake::core {

// Cross-platform safe getenv wrapper.
// - Windows: uses _dupenv_s and frees the allocated buffer
// - POSIX/others: uses std::getenv (read-only)
// Returns std::nullopt if the variable is not set. If set but empty, returns an
// engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    const errno_t err = _dupenv_s(&buf, &len, name);
    if (err != 0 || buf == nullptr) {
        if (buf) std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

// VEXLAKE_DEBUG=1 enables informational stderr diagnostics. Read once per process.
inline bool debug_enabled() noexcept {
    static const bool enabled = [] {
        auto v = safe_getenv("VEXLAKE_DEBUG");
        return v && !v->empty() && (*v)[0] != '0';
    }();
    return enabled;
}

} // namespace vexlake::core
