/*
 * ScriptCell C++ - Result Collector Implementation
 */
#include <scriptcell/core/result_collector.hpp>
#include <scriptcell/core/policy.hpp>
#include <scriptcell/core/logger.hpp>
#include <scriptcell/core/utils.hpp>

#include <csignal>
#include <exception>

namespace scriptcell {

namespace {

// A single report line never needs more than this; anything longer is
// a misbehaving worker and the line is discarded.
const size_t MAX_REPORT_LINE = 1024 * 1024;

std::string signal_name(int sig) {
    switch (sig) {
        case SIGKILL: return "SIGKILL";
        case SIGSEGV: return "SIGSEGV";
        case SIGABRT: return "SIGABRT";
        case SIGBUS:  return "SIGBUS";
        case SIGFPE:  return "SIGFPE";
        case SIGILL:  return "SIGILL";
        case SIGSYS:  return "SIGSYS";
        case SIGTERM: return "SIGTERM";
        case SIGXCPU: return "SIGXCPU";
        case SIGXFSZ: return "SIGXFSZ";
        case SIGPIPE: return "SIGPIPE";
        default:      return "signal " + std::to_string(sig);
    }
}

void mark_crashed(ExecutionOutcome& outcome, const std::string& text) {
    outcome.success = false;
    outcome.state = ExecutionState::CRASHED;
    outcome.set_exception(ErrorKind::WORKER_CRASH, "WorkerError: " + text);
}

} // anonymous namespace

// ============ StreamCapture ============

StreamCapture::StreamCapture(size_t max_bytes)
    : max_bytes_(max_bytes)
    , total_(0) {}

void StreamCapture::append(const char* data, size_t len) {
    total_ += len;
    if (data_.size() >= max_bytes_) return;
    size_t room = max_bytes_ - data_.size();
    data_.append(data, len < room ? len : room);
}

// ============ ReportChannel ============

ReportChannel::ReportChannel(const std::string& token)
    : token_(token)
    , overflow_(false)
    , ready_(false)
    , landlock_(false)
    , has_violation_(false)
    , has_finished_(false)
    , setup_failed_(false)
    , malformed_(0) {}

void ReportChannel::feed(const char* data, size_t len) {
    size_t start = 0;
    for (size_t i = 0; i < len; ++i) {
        if (data[i] != '\n') continue;

        if (!overflow_) {
            pending_.append(data + start, i - start);
            handle_line(pending_);
        } else {
            ++malformed_;
        }
        pending_.clear();
        overflow_ = false;
        start = i + 1;
    }

    if (start < len && !overflow_) {
        pending_.append(data + start, len - start);
        if (pending_.size() > MAX_REPORT_LINE) {
            pending_.clear();
            overflow_ = true;
        }
    }
}

void ReportChannel::finish() {
    if (!pending_.empty() && !overflow_) {
        handle_line(pending_);
    }
    pending_.clear();
    overflow_ = false;
}

void ReportChannel::handle_line(const std::string& line) {
    if (line.empty()) return;

    protocol::ReportRecord record;
    if (!protocol::ReportRecord::parse(line, record)) {
        ++malformed_;
        LOG_WARN("[Collector] discarding malformed report record (%zu bytes)", line.size());
        return;
    }
    if (!token_.empty() && record.token != token_) {
        ++malformed_;
        LOG_WARN("[Collector] discarding report record with a foreign token");
        return;
    }

    switch (record.event) {
        case protocol::ReportEvent::READY:
            ready_ = true;
            landlock_ = record.landlock;
            break;
        case protocol::ReportEvent::VIOLATION:
            // The first denial is the one that stopped the guest
            if (!has_violation_) {
                has_violation_ = true;
                violation_ = record;
            }
            break;
        case protocol::ReportEvent::FINISHED:
            if (!has_finished_) {
                has_finished_ = true;
                finished_ = record;
            }
            break;
        case protocol::ReportEvent::SETUP_FAILED:
            setup_failed_ = true;
            setup_message_ = record.message;
            break;
        default:
            ++malformed_;
            break;
    }
}

// ============ ResultCollector ============

ResultCollector::ResultCollector(const ResourceLimits& limits, const std::string& report_token)
    : limits_(limits)
    , stdout_(static_cast<size_t>(limits.max_output_bytes))
    , stderr_(static_cast<size_t>(limits.max_output_bytes))
    , report_(report_token) {}

std::string ResultCollector::timeout_message(double timeout_seconds) {
    return "TimeoutError: Script execution timed out after " + format_seconds(timeout_seconds) + " seconds";
}

std::string ResultCollector::memory_message(int64_t memory_mb) {
    return "MemoryError: Script exceeded the memory limit of " + std::to_string(memory_mb) + " MB";
}

ExecutionOutcome ResultCollector::launch_failure(const std::string& message) {
    ExecutionOutcome outcome;
    mark_crashed(outcome, "Failed to start sandbox worker: " + message);
    return outcome;
}

ExecutionOutcome ResultCollector::finish(const SupervisionResult& supervision) const {
    try {
        return classify(supervision);
    } catch (const std::exception& e) {
        // Allocation failure while copying captured output; report the run
        // as crashed rather than losing it.
        LOG_ERROR("[Collector] failed to assemble outcome: %s", e.what());
        ExecutionOutcome outcome;
        outcome.duration_ms = supervision.duration_ms;
        mark_crashed(outcome, "Failed to collect result");
        return outcome;
    }
}

ExecutionOutcome ResultCollector::classify(const SupervisionResult& supervision) const {
    ExecutionOutcome outcome;
    outcome.stdout_text = stdout_.data();
    outcome.stderr_text = stderr_.data();
    outcome.stdout_truncated = stdout_.truncated();
    outcome.stderr_truncated = stderr_.truncated();
    outcome.duration_ms = supervision.duration_ms;
    outcome.success = false;

    const WorkerExit& exit = supervision.exit;

    // A capability denial outranks everything: the worker stopped itself
    if (report_.has_violation()) {
        const protocol::ReportRecord& v = report_.violation();
        outcome.state = ExecutionState::CAPABILITY_VIOLATION;
        outcome.set_exception(v.violation == CapabilityError::MODULE_DENIED
                                  ? ErrorKind::MODULE_DENIED : ErrorKind::OPERATION_DENIED,
                              CapabilityPolicy::violation_message(v.violation, v.name));
        return outcome;
    }

    // The guest finished; a kill that raced worker teardown does not change that
    if (report_.has_finished()) {
        const protocol::ReportRecord& f = report_.finished();
        switch (f.status) {
            case protocol::FinishStatus::COMPLETED:
                outcome.state = ExecutionState::COMPLETED;
                outcome.set_exit_code(f.has_exit_code ? f.exit_code : 0);
                outcome.success = outcome.exit_code == 0;
                break;
            case protocol::FinishStatus::EXCEPTION:
            case protocol::FinishStatus::SYNTAX_ERROR:
                outcome.state = ExecutionState::COMPLETED;
                outcome.set_exception(f.status == protocol::FinishStatus::SYNTAX_ERROR
                                          ? ErrorKind::SYNTAX_ERROR : ErrorKind::GUEST_EXCEPTION,
                                      f.exception);
                outcome.set_exit_code(f.has_exit_code ? f.exit_code : 1);
                break;
            case protocol::FinishStatus::MEMORY:
                outcome.state = ExecutionState::MEMORY_EXCEEDED;
                outcome.set_exception(ErrorKind::MEMORY, memory_message(limits_.memory_mb()));
                break;
        }
        return outcome;
    }

    if (supervision.verdict == GovernorVerdict::TIMED_OUT) {
        outcome.state = ExecutionState::TIMED_OUT;
        outcome.set_exception(ErrorKind::TIMEOUT, timeout_message(limits_.timeout_seconds));
        return outcome;
    }

    if (supervision.verdict == GovernorVerdict::MEMORY_EXCEEDED) {
        outcome.state = ExecutionState::MEMORY_EXCEEDED;
        outcome.set_exception(ErrorKind::MEMORY, memory_message(limits_.memory_mb()));
        return outcome;
    }

    if (report_.setup_failed()) {
        mark_crashed(outcome, report_.setup_message());
        return outcome;
    }

    if (exit.signaled) {
        if (exit.term_signal == SIGXCPU) {
            // CPU rlimit backstop fired before the wall clock did
            outcome.state = ExecutionState::TIMED_OUT;
            outcome.set_exception(ErrorKind::TIMEOUT, timeout_message(limits_.timeout_seconds));
            return outcome;
        }
        if (exit.term_signal == SIGSYS) {
            // Process filter killed the worker before its handler could report
            outcome.state = ExecutionState::CAPABILITY_VIOLATION;
            outcome.set_exception(ErrorKind::OPERATION_DENIED,
                                  CapabilityPolicy::violation_message(CapabilityError::OPERATION_DENIED, "syscall"));
            return outcome;
        }
        mark_crashed(outcome, "Sandbox worker was killed by " + signal_name(exit.term_signal));
        return outcome;
    }

    if (exit.exited && exit.exit_status == protocol::EXIT_EXEC_FAILED && !report_.ready()) {
        mark_crashed(outcome, "Failed to start sandbox worker: exec failed");
        return outcome;
    }

    if (exit.exited) {
        mark_crashed(outcome, "Sandbox worker exited with status " + std::to_string(exit.exit_status) +
                              " without reporting a result");
        return outcome;
    }

    mark_crashed(outcome, "Sandbox worker ended without reporting a result");
    return outcome;
}

} // namespace scriptcell
