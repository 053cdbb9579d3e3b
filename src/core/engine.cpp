/*
 * ScriptCell C++ - Script Engine Implementation
 */
#include <scriptcell/core/engine.hpp>
#include <scriptcell/core/config.hpp>
#include <scriptcell/core/governor.hpp>
#include <scriptcell/core/result_collector.hpp>
#include <scriptcell/core/worker_process.hpp>
#include <scriptcell/core/logger.hpp>
#include <scriptcell/core/utils.hpp>
#include <scriptcell/worker/protocol.hpp>

#include <csignal>
#include <exception>
#include <mutex>

namespace scriptcell {

namespace {

// A worker that dies while its request is being written must not take
// the host down with SIGPIPE
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

std::vector<std::string> to_vector(const std::set<std::string>& items) {
    return std::vector<std::string>(items.begin(), items.end());
}

} // anonymous namespace

// ============ SandboxOptions ============

std::string SandboxOptions::default_worker_path() {
    return join_path(executable_dir(), "scriptcell-worker");
}

SandboxOptions SandboxOptions::from_config(const Config& cfg) {
    SandboxOptions options;
    options.worker_path = cfg.get_string("worker.path", "");
    if (options.worker_path.empty()) {
        options.worker_path = default_worker_path();
    }
    options.require_landlock = cfg.get_bool("sandbox.require_landlock", false);
    options.readonly_paths = cfg.get_string_list("sandbox.readonly_paths", std::vector<std::string>());
    return options;
}

// ============ EngineResult ============

Json EngineResult::to_json() const {
    if (accepted) {
        return outcome.to_json();
    }
    Json j;
    j["success"] = false;
    j["rejected"] = true;
    j["source_error"] = source_error_name(source_error);
    j["message"] = message;
    return j;
}

// ============ ScriptEngine ============

ScriptEngine::ScriptEngine(const CapabilityPolicy& policy,
                           const ResourceLimits& limits,
                           const SourceStore& store,
                           const SandboxOptions& options)
    : policy_(policy)
    , limits_(limits)
    , loader_(store, limits.max_source_bytes)
    , options_(options) {
    ignore_sigpipe();
}

EngineResult ScriptEngine::run(const ExecutionRequest& request) const {
    SourceLoadResult source = loader_.load(request);
    if (!source.ok) {
        LOG_INFO("[Engine] Rejected %s request: %s",
                 request.is_file ? "file" : "inline", source.message.c_str());
        return EngineResult::rejected(source.error, source.message);
    }

    LOG_DEBUG("[Engine] Source %s (%zu bytes, sha256 %s)",
              source.origin.c_str(), source.text.size(), sha256_hex(source.text).c_str());
    return EngineResult::executed(execute(source.text));
}

ExecutionOutcome ScriptEngine::execute(const std::string& source) const {
    std::string execution_id = generate_uuid();
    ExecutionOutcome outcome;

    try {
        protocol::WorkerRequest request;
        request.source = source;
        request.allowed_modules = to_vector(policy_.allowed_modules());
        request.denied_operations = to_vector(policy_.denied_operations());
        request.readonly_paths = options_.readonly_paths;
        request.recursion_limit = limits_.recursion_limit;
        request.require_landlock = options_.require_landlock;
        request.token = secure_token();

        WorkerProcess worker;
        std::string error;
        if (!worker.start(options_.worker_path, limits_, error)) {
            LOG_ERROR("[Engine] %s: cannot start worker: %s", execution_id.c_str(), error.c_str());
            outcome = ResultCollector::launch_failure(error);
        } else {
            LOG_DEBUG("[Engine] %s: worker pid %d", execution_id.c_str(), static_cast<int>(worker.pid()));

            ResultCollector collector(limits_, request.token);
            ResourceGovernor governor(limits_);
            SupervisionResult supervision = governor.supervise(worker, dump_json(request.to_json()), collector);
            outcome = collector.finish(supervision);

            if (!collector.report().ready() && outcome.state == ExecutionState::CRASHED) {
                LOG_WARN("[Engine] %s: worker failed before the guest started", execution_id.c_str());
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Engine] %s: execution failed: %s", execution_id.c_str(), e.what());
        outcome = ResultCollector::launch_failure(e.what());
    }

    outcome.execution_id = execution_id;
    LOG_INFO("[Engine] %s: %s in %lld ms%s%s",
             execution_id.c_str(),
             execution_state_name(outcome.state),
             static_cast<long long>(outcome.duration_ms),
             outcome.has_exception ? " - " : "",
             outcome.has_exception ? truncate_safe(outcome.exception, 200).c_str() : "");
    return outcome;
}

} // namespace scriptcell
