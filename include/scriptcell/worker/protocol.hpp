/*
 * ScriptCell C++ - Host <-> Worker Protocol
 *
 * The host spawns one scriptcell-worker per execution with:
 *   fd 0  /dev/null
 *   fd 1  guest stdout (pipe)
 *   fd 2  guest stderr (pipe)
 *   fd 3  request (pipe, host -> worker): one JSON document, then EOF
 *   fd 4  report (pipe, worker -> host): one JSON record per line
 *
 * Report records:
 *   {"event":"ready","landlock":true}
 *   {"event":"violation","kind":"module_denied","name":"os"}
 *   {"event":"finished","status":"completed","exit_code":0}
 *   {"event":"finished","status":"exception","exception":"Traceback ...","exit_code":1}
 *   {"event":"setup_failed","message":"..."}
 */
#ifndef scriptcell_WORKER_PROTOCOL_HPP
#define scriptcell_WORKER_PROTOCOL_HPP

#include <scriptcell/core/json.hpp>
#include <scriptcell/core/policy.hpp>
#include <string>
#include <vector>

namespace scriptcell {
namespace protocol {

const int REQUEST_FD = 3;
const int REPORT_FD = 4;

// Worker exit statuses that are not guest exit codes
const int EXIT_VIOLATION = 120;
const int EXIT_SETUP_FAILED = 121;
const int EXIT_EXEC_FAILED = 127;

// Filename of the guest's code objects; frames with it are guest frames
const char* const GUEST_FILENAME = "<script>";

struct WorkerRequest {
    std::string source;
    std::vector<std::string> allowed_modules;
    std::vector<std::string> denied_operations;
    std::vector<std::string> readonly_paths;   // Extra read-only Landlock paths
    std::string token;                          // Echoed in every report record
    int recursion_limit;
    bool require_landlock;

    WorkerRequest() : recursion_limit(1000), require_landlock(false) {}

    Json to_json() const;
    static bool from_json(const Json& j, WorkerRequest& out, std::string& error);
};

enum class ReportEvent {
    UNKNOWN,
    READY,
    VIOLATION,
    FINISHED,
    SETUP_FAILED
};

enum class FinishStatus {
    COMPLETED,      // Ran to the end or raised SystemExit
    EXCEPTION,      // Uncaught guest exception
    SYNTAX_ERROR,   // Source did not compile
    MEMORY          // Uncaught MemoryError
};

const char* finish_status_name(FinishStatus status);

struct ReportRecord {
    ReportEvent event;
    CapabilityError violation;
    std::string name;           // Denied module / operation
    FinishStatus status;
    std::string exception;
    bool has_exit_code;
    int exit_code;
    bool landlock;
    std::string message;
    std::string token;

    ReportRecord()
        : event(ReportEvent::UNKNOWN)
        , violation(CapabilityError::NONE)
        , status(FinishStatus::COMPLETED)
        , has_exit_code(false)
        , exit_code(0)
        , landlock(false) {}

    // One line of the report stream (without the newline)
    static bool parse(const std::string& line, ReportRecord& out);

    static ReportRecord ready(bool landlock);
    static ReportRecord denied(CapabilityError error, const std::string& name);
    static ReportRecord finished(FinishStatus status, int exit_code, const std::string& exception);
    static ReportRecord setup_failed(const std::string& message);

    // Serialized record, framed by newlines on both sides so a record
    // always starts on a fresh line even after stray bytes on the stream
    std::string serialize() const;
};

} // namespace protocol
} // namespace scriptcell

#endif // scriptcell_WORKER_PROTOCOL_HPP
