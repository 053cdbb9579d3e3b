/*
 * ScriptCell C++ - Script Engine
 *
 * One request in, one result out:
 *   SourceLoader -> WorkerProcess (isolation boundary)
 *                -> ResourceGovernor -> ResultCollector
 *
 * The engine holds only read-only state and may be shared by any number
 * of threads; every run gets its own worker process.
 */
#ifndef scriptcell_CORE_ENGINE_HPP
#define scriptcell_CORE_ENGINE_HPP

#include "json.hpp"
#include "limits.hpp"
#include "outcome.hpp"
#include "policy.hpp"
#include "source_loader.hpp"
#include <string>
#include <vector>

namespace scriptcell {

class Config;

struct SandboxOptions {
    std::string worker_path;
    bool require_landlock;
    std::vector<std::string> readonly_paths;   // Extra paths the guest may read

    SandboxOptions() : require_landlock(false) {}

    // worker.path, sandbox.require_landlock, sandbox.readonly_paths
    static SandboxOptions from_config(const Config& cfg);

    // scriptcell-worker beside the running executable
    static std::string default_worker_path();
};

// Either a rejection (nothing ran) or an execution outcome
struct EngineResult {
    bool accepted;
    SourceError source_error;
    std::string message;
    ExecutionOutcome outcome;

    EngineResult() : accepted(false), source_error(SourceError::NONE) {}

    static EngineResult rejected(SourceError error, const std::string& message) {
        EngineResult r;
        r.source_error = error;
        r.message = message;
        return r;
    }

    static EngineResult executed(const ExecutionOutcome& outcome) {
        EngineResult r;
        r.accepted = true;
        r.outcome = outcome;
        return r;
    }

    Json to_json() const;
};

class ScriptEngine {
public:
    ScriptEngine(const CapabilityPolicy& policy,
                 const ResourceLimits& limits,
                 const SourceStore& store,
                 const SandboxOptions& options);

    EngineResult run(const ExecutionRequest& request) const;

    // Run already-resolved source text
    ExecutionOutcome execute(const std::string& source) const;

    const CapabilityPolicy& policy() const { return policy_; }
    const ResourceLimits& limits() const { return limits_; }
    const SandboxOptions& options() const { return options_; }

private:
    const CapabilityPolicy& policy_;
    const ResourceLimits& limits_;
    SourceLoader loader_;
    SandboxOptions options_;
};

} // namespace scriptcell

#endif // scriptcell_CORE_ENGINE_HPP
