/*
 * ScriptCell C++ - Host <-> Worker Protocol
 */
#include <scriptcell/worker/protocol.hpp>

namespace scriptcell {
namespace protocol {

static Json string_array(const std::vector<std::string>& items) {
    Json arr = Json::array();
    for (size_t i = 0; i < items.size(); ++i) {
        arr.push_back(items[i]);
    }
    return arr;
}

static bool read_string_array(const Json& j, const char* key,
                              std::vector<std::string>& out, std::string& error) {
    out.clear();
    if (!j.contains(key)) return true;
    const Json& arr = j[key];
    if (!arr.is_array()) {
        error = std::string(key) + " must be an array";
        return false;
    }
    for (const auto& item : arr) {
        if (!item.is_string()) {
            error = std::string(key) + " must contain only strings";
            return false;
        }
        out.push_back(item.get<std::string>());
    }
    return true;
}

Json WorkerRequest::to_json() const {
    Json j;
    j["source"] = source;
    j["allowed_modules"] = string_array(allowed_modules);
    j["denied_operations"] = string_array(denied_operations);
    j["readonly_paths"] = string_array(readonly_paths);
    j["token"] = token;
    j["recursion_limit"] = recursion_limit;
    j["require_landlock"] = require_landlock;
    return j;
}

bool WorkerRequest::from_json(const Json& j, WorkerRequest& out, std::string& error) {
    if (!j.is_object() || !j.contains("source") || !j["source"].is_string()) {
        error = "request has no source";
        return false;
    }
    out.source = j["source"].get<std::string>();

    if (!read_string_array(j, "allowed_modules", out.allowed_modules, error)) return false;
    if (!read_string_array(j, "denied_operations", out.denied_operations, error)) return false;
    if (!read_string_array(j, "readonly_paths", out.readonly_paths, error)) return false;

    if (j.contains("token") && j["token"].is_string()) {
        out.token = j["token"].get<std::string>();
    }
    if (j.contains("recursion_limit") && j["recursion_limit"].is_number_integer()) {
        out.recursion_limit = j["recursion_limit"].get<int>();
    }
    if (j.contains("require_landlock") && j["require_landlock"].is_boolean()) {
        out.require_landlock = j["require_landlock"].get<bool>();
    }
    return true;
}

const char* finish_status_name(FinishStatus status) {
    switch (status) {
        case FinishStatus::COMPLETED: return "completed";
        case FinishStatus::EXCEPTION: return "exception";
        case FinishStatus::SYNTAX_ERROR: return "syntax_error";
        case FinishStatus::MEMORY: return "memory";
        default: return "completed";
    }
}

static bool parse_finish_status(const std::string& name, FinishStatus& out) {
    if (name == "completed") { out = FinishStatus::COMPLETED; return true; }
    if (name == "exception") { out = FinishStatus::EXCEPTION; return true; }
    if (name == "syntax_error") { out = FinishStatus::SYNTAX_ERROR; return true; }
    if (name == "memory") { out = FinishStatus::MEMORY; return true; }
    return false;
}

// Field accessors throw on a type mismatch; ReportRecord::parse catches
static bool parse_record(const Json& j, ReportRecord& out) {
    if (!j.is_object() || !j.contains("event") || !j["event"].is_string()) {
        return false;
    }

    out = ReportRecord();
    std::string event = j["event"].get<std::string>();
    out.token = j.value("token", std::string());

    if (event == "ready") {
        out.event = ReportEvent::READY;
        out.landlock = j.value("landlock", false);
        return true;
    }

    if (event == "violation") {
        std::string kind = j.value("kind", std::string());
        if (kind == "module_denied") {
            out.violation = CapabilityError::MODULE_DENIED;
        } else if (kind == "operation_denied") {
            out.violation = CapabilityError::OPERATION_DENIED;
        } else {
            return false;
        }
        out.event = ReportEvent::VIOLATION;
        out.name = j.value("name", std::string());
        return true;
    }

    if (event == "finished") {
        if (!parse_finish_status(j.value("status", std::string()), out.status)) {
            return false;
        }
        out.event = ReportEvent::FINISHED;
        out.exception = j.value("exception", std::string());
        if (j.contains("exit_code") && j["exit_code"].is_number_integer()) {
            out.has_exit_code = true;
            out.exit_code = j["exit_code"].get<int>();
        }
        return true;
    }

    if (event == "setup_failed") {
        out.event = ReportEvent::SETUP_FAILED;
        out.message = j.value("message", std::string());
        return true;
    }

    return false;
}

bool ReportRecord::parse(const std::string& line, ReportRecord& out) {
    try {
        return parse_record(Json::parse(line), out);
    } catch (const Json::exception&) {
        return false;
    }
}

ReportRecord ReportRecord::ready(bool landlock) {
    ReportRecord r;
    r.event = ReportEvent::READY;
    r.landlock = landlock;
    return r;
}

ReportRecord ReportRecord::denied(CapabilityError error, const std::string& name) {
    ReportRecord r;
    r.event = ReportEvent::VIOLATION;
    r.violation = error;
    r.name = name;
    return r;
}

ReportRecord ReportRecord::finished(FinishStatus status, int exit_code, const std::string& exception) {
    ReportRecord r;
    r.event = ReportEvent::FINISHED;
    r.status = status;
    r.has_exit_code = true;
    r.exit_code = exit_code;
    r.exception = exception;
    return r;
}

ReportRecord ReportRecord::setup_failed(const std::string& message) {
    ReportRecord r;
    r.event = ReportEvent::SETUP_FAILED;
    r.message = message;
    return r;
}

std::string ReportRecord::serialize() const {
    Json j;
    switch (event) {
        case ReportEvent::READY:
            j["event"] = "ready";
            j["landlock"] = landlock;
            break;
        case ReportEvent::VIOLATION:
            j["event"] = "violation";
            j["kind"] = capability_error_name(violation);
            j["name"] = name;
            break;
        case ReportEvent::FINISHED:
            j["event"] = "finished";
            j["status"] = finish_status_name(status);
            if (has_exit_code) j["exit_code"] = exit_code;
            if (!exception.empty()) j["exception"] = exception;
            break;
        case ReportEvent::SETUP_FAILED:
            j["event"] = "setup_failed";
            j["message"] = message;
            break;
        default:
            j["event"] = "unknown";
            break;
    }
    if (!token.empty()) j["token"] = token;
    return "\n" + dump_json(j) + "\n";
}

} // namespace protocol
} // namespace scriptcell
