/*
 * ScriptCell C++ - Resource Governor
 *
 * Supervises one running worker with two independent watchdogs:
 *   - wall clock: the deadline is measured on the monotonic clock
 *   - memory: resident set size sampled from /proc every tick
 * Crossing either one SIGKILLs the worker's process group. There is no
 * graceful shutdown; the guest is not trusted to cooperate.
 *
 * While supervising, the governor also delivers the request to the worker
 * and pumps its output pipes into the ResultCollector, so output written
 * before a kill is kept.
 */
#ifndef scriptcell_CORE_GOVERNOR_HPP
#define scriptcell_CORE_GOVERNOR_HPP

#include "limits.hpp"
#include "worker_process.hpp"
#include <string>
#include <cstdint>
#include <sys/types.h>

namespace scriptcell {

class ResultCollector;

enum class GovernorVerdict {
    NONE,
    TIMED_OUT,
    MEMORY_EXCEEDED
};

struct SupervisionResult {
    GovernorVerdict verdict;
    WorkerExit exit;
    int64_t duration_ms;
    int64_t peak_rss_bytes;     // -1 if never sampled
    bool request_delivered;

    SupervisionResult()
        : verdict(GovernorVerdict::NONE)
        , duration_ms(0)
        , peak_rss_bytes(-1)
        , request_delivered(false) {}
};

class ResourceGovernor {
public:
    explicit ResourceGovernor(const ResourceLimits& limits);

    // Runs until the worker is gone. Always leaves the worker reaped.
    SupervisionResult supervise(WorkerProcess& worker,
                                const std::string& request_payload,
                                ResultCollector& collector) const;

    // VmRSS of pid in bytes, -1 if unavailable (e.g. already a zombie)
    static int64_t read_rss_bytes(pid_t pid);

private:
    ResourceLimits limits_;
};

} // namespace scriptcell

#endif // scriptcell_CORE_GOVERNOR_HPP
