/*
 * ScriptCell C++ - Resource Limits Implementation
 */
#include <scriptcell/core/limits.hpp>
#include <scriptcell/core/config.hpp>
#include <scriptcell/core/logger.hpp>

namespace scriptcell {

ResourceLimits ResourceLimits::from_config(const Config& cfg) {
    ResourceLimits limits;

    double timeout = cfg.get_double("limits.timeout_seconds", limits.timeout_seconds);
    if (timeout > 0) {
        limits.timeout_seconds = timeout;
    } else {
        LOG_WARN("limits.timeout_seconds must be positive, keeping %.1f", limits.timeout_seconds);
    }

    int64_t memory_mb = cfg.get_int("limits.memory_mb", limits.memory_mb());
    if (memory_mb > 0) {
        limits.memory_bytes = memory_mb * 1024 * 1024;
    } else {
        LOG_WARN("limits.memory_mb must be positive, keeping %lld", static_cast<long long>(limits.memory_mb()));
    }

    int64_t max_source = cfg.get_int("limits.max_source_bytes", limits.max_source_bytes);
    if (max_source > 0) {
        limits.max_source_bytes = max_source;
    }

    int64_t max_output = cfg.get_int("limits.max_output_bytes", limits.max_output_bytes);
    if (max_output > 0) {
        limits.max_output_bytes = max_output;
    }

    int64_t recursion = cfg.get_int("limits.recursion_limit", limits.recursion_limit);
    if (recursion >= 50) {
        limits.recursion_limit = static_cast<int>(recursion);
    }

    int64_t poll = cfg.get_int("limits.poll_interval_ms", limits.poll_interval_ms);
    if (poll > 0 && poll <= 1000) {
        limits.poll_interval_ms = static_cast<int>(poll);
    }

    return limits;
}

} // namespace scriptcell
