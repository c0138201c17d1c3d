//
//  dl_config.hpp
//
//  Engine configuration: plain values with documented defaults
//

#pragma once

#include <cstdint>
#include <string>

namespace msdl {

constexpr int64_t kMiB = 1024LL * 1024LL;

constexpr const char* kDefaultEndpoint = "https://modelscope.cn";
constexpr const char* kDefaultRevision = "master";

struct DownloadConfig {
    // Worker threads shared by every file of one invocation.
    int max_workers = 4;

    // Files below this size are fetched with a single range.
    int64_t chunk_threshold_bytes = 8 * kMiB;

    // Lower bound on range length when a file is partitioned.
    int64_t min_chunk_bytes = 4 * kMiB;

    // Applied per HTTP request, never per file.
    int request_timeout_seconds = 30;
    int connect_timeout_seconds = 10;

    // Attempts per range, first try included.
    int max_attempts = 3;
    int backoff_initial_ms = 500;
    int backoff_max_ms = 8000;

    // A range longer than this records its committed prefix every so many bytes.
    int64_t checkpoint_bytes = 16 * kMiB;

    bool verify_sha256 = true;

    std::string endpoint = kDefaultEndpoint;
    std::string revision = kDefaultRevision;

    // Opaque bearer token; empty for public repositories.
    std::string access_token;
};

// Delay before retry number `attempt` (1-based): initial * 2^(attempt-1), capped.
inline int64_t BackoffDelayMs(const DownloadConfig& config, int attempt) {
    int64_t delay = config.backoff_initial_ms;
    for (int i = 1; i < attempt && delay < config.backoff_max_ms; ++i) {
        delay *= 2;
    }
    return delay < config.backoff_max_ms ? delay : config.backoff_max_ms;
}

} // namespace msdl
