/*
 * ScriptCell C++ - Resource Limits
 *
 * Supplied by configuration, never by the guest. Immutable once built.
 */
#ifndef scriptcell_CORE_LIMITS_HPP
#define scriptcell_CORE_LIMITS_HPP

#include <cstdint>

namespace scriptcell {

class Config;

struct ResourceLimits {
    double timeout_seconds;     // Wall clock (default: 30)
    int64_t memory_bytes;       // Address space / resident ceiling (default: 256 MB)
    int64_t max_source_bytes;   // Resolved source text (default: 1 MB)
    int64_t max_output_bytes;   // Captured per stream (default: 8 MB)
    int recursion_limit;        // Guest interpreter recursion depth (default: 1000)
    int poll_interval_ms;       // Governor tick (default: 20)

    ResourceLimits()
        : timeout_seconds(30.0)
        , memory_bytes(256LL * 1024 * 1024)
        , max_source_bytes(1024LL * 1024)
        , max_output_bytes(8LL * 1024 * 1024)
        , recursion_limit(1000)
        , poll_interval_ms(20) {}

    static ResourceLimits from_config(const Config& cfg);

    int64_t timeout_ms() const { return static_cast<int64_t>(timeout_seconds * 1000.0); }
    int64_t memory_mb() const { return memory_bytes / (1024 * 1024); }
};

} // namespace scriptcell

#endif // scriptcell_CORE_LIMITS_HPP
