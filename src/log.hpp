#pragma once

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace rrf {

// Tracing is enabled by setting RRF_LOG to anything other than "0".
inline bool log_enabled() {
    static const bool enabled = [] {
        const char *e = std::getenv("RRF_LOG");
        return e != nullptr && std::strcmp(e, "0") != 0;
    }();
    return enabled;
}

}  // namespace rrf

#define RRF_LOG(fmt, ...) \
    do { if (::rrf::log_enabled()) std::fprintf(stderr, "[randrelu] " fmt "\n", ##__VA_ARGS__); } while (0)
