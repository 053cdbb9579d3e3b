/*
 * ScriptCell C++ - Execution Request / Outcome
 */
#include <scriptcell/core/outcome.hpp>

namespace scriptcell {

bool ExecutionRequest::from_json(const Json& j, ExecutionRequest& out, std::string& error) {
    if (!j.is_object()) {
        error = "Request must be a JSON object";
        return false;
    }
    if (!j.contains("script") || !j["script"].is_string()) {
        error = "Missing required parameter: script";
        return false;
    }
    out.source = j["script"].get<std::string>();
    out.is_file = false;

    if (j.contains("is_file") && !j["is_file"].is_null()) {
        if (!j["is_file"].is_boolean()) {
            error = "Parameter is_file must be a boolean";
            return false;
        }
        out.is_file = j["is_file"].get<bool>();
    }
    return true;
}

const char* execution_state_name(ExecutionState state) {
    switch (state) {
        case ExecutionState::CREATED: return "created";
        case ExecutionState::RUNNING: return "running";
        case ExecutionState::COMPLETED: return "completed";
        case ExecutionState::TIMED_OUT: return "timed_out";
        case ExecutionState::MEMORY_EXCEEDED: return "memory_exceeded";
        case ExecutionState::CAPABILITY_VIOLATION: return "capability_violation";
        case ExecutionState::CRASHED: return "crashed";
        default: return "unknown";
    }
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::GUEST_EXCEPTION: return "guest_exception";
        case ErrorKind::SYNTAX_ERROR: return "syntax_error";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::MEMORY: return "memory";
        case ErrorKind::MODULE_DENIED: return "module_denied";
        case ErrorKind::OPERATION_DENIED: return "operation_denied";
        case ErrorKind::WORKER_CRASH: return "worker_crash";
        default: return "none";
    }
}

Json ExecutionOutcome::to_json() const {
    Json j;
    j["success"] = success;
    j["stdout"] = stdout_text;
    j["stderr"] = stderr_text;
    j["exception"] = has_exception ? Json(exception) : Json(nullptr);
    j["exit_code"] = has_exit_code ? Json(exit_code) : Json(nullptr);
    j["termination"] = execution_state_name(state);
    j["error_kind"] = error_kind == ErrorKind::NONE ? Json(nullptr) : Json(error_kind_name(error_kind));
    j["execution_id"] = execution_id;
    j["duration_ms"] = duration_ms;
    if (stdout_truncated) j["stdout_truncated"] = true;
    if (stderr_truncated) j["stderr_truncated"] = true;
    return j;
}

} // namespace scriptcell
