/*
 * ScriptCell C++ - Execution Request / Outcome
 *
 * Response shape:
 *   { "success": bool, "stdout": str, "stderr": str,
 *     "exception": str|null, "exit_code": int|null, ... }
 */
#ifndef scriptcell_CORE_OUTCOME_HPP
#define scriptcell_CORE_OUTCOME_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace scriptcell {

struct ExecutionRequest {
    std::string source;     // Script text, or a path when is_file is set
    bool is_file;

    ExecutionRequest() : is_file(false) {}
    ExecutionRequest(const std::string& s, bool file) : source(s), is_file(file) {}

    // {"script": "...", "is_file": false}. Returns false on a malformed request.
    static bool from_json(const Json& j, ExecutionRequest& out, std::string& error);
};

// Lifecycle of one isolated execution:
//   CREATED -> RUNNING -> { COMPLETED, TIMED_OUT, MEMORY_EXCEEDED,
//                           CAPABILITY_VIOLATION, CRASHED }
enum class ExecutionState {
    CREATED,
    RUNNING,
    COMPLETED,
    TIMED_OUT,
    MEMORY_EXCEEDED,
    CAPABILITY_VIOLATION,
    CRASHED
};

const char* execution_state_name(ExecutionState state);

// Machine-readable reason for a failed outcome
enum class ErrorKind {
    NONE,
    GUEST_EXCEPTION,
    SYNTAX_ERROR,
    TIMEOUT,
    MEMORY,
    MODULE_DENIED,
    OPERATION_DENIED,
    WORKER_CRASH
};

const char* error_kind_name(ErrorKind kind);

struct ExecutionOutcome {
    bool success;
    std::string stdout_text;
    std::string stderr_text;
    bool has_exception;
    std::string exception;
    bool has_exit_code;     // false: no exit code observed
    int exit_code;

    ExecutionState state;
    ErrorKind error_kind;
    std::string execution_id;
    int64_t duration_ms;
    bool stdout_truncated;
    bool stderr_truncated;

    ExecutionOutcome()
        : success(false)
        , has_exception(false)
        , has_exit_code(false)
        , exit_code(0)
        , state(ExecutionState::CREATED)
        , error_kind(ErrorKind::NONE)
        , duration_ms(0)
        , stdout_truncated(false)
        , stderr_truncated(false) {}

    void set_exception(ErrorKind kind, const std::string& text) {
        has_exception = true;
        exception = text;
        error_kind = kind;
    }

    void set_exit_code(int code) {
        has_exit_code = true;
        exit_code = code;
    }

    Json to_json() const;
};

} // namespace scriptcell

#endif // scriptcell_CORE_OUTCOME_HPP
