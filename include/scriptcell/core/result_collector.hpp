/*
 * ScriptCell C++ - Result Collector
 *
 * Gathers everything a worker produces (stdout, stderr, report records)
 * and turns it, together with the governor's verdict and the worker's
 * exit status, into exactly one ExecutionOutcome.
 */
#ifndef scriptcell_CORE_RESULT_COLLECTOR_HPP
#define scriptcell_CORE_RESULT_COLLECTOR_HPP

#include "governor.hpp"
#include "limits.hpp"
#include "outcome.hpp"
#include <scriptcell/worker/protocol.hpp>
#include <string>
#include <cstddef>

namespace scriptcell {

// Byte-exact capture of one output stream, bounded by a ceiling.
// Bytes past the ceiling are counted and dropped.
class StreamCapture {
public:
    explicit StreamCapture(size_t max_bytes);

    void append(const char* data, size_t len);

    const std::string& data() const { return data_; }
    bool truncated() const { return total_ > data_.size(); }
    size_t total_bytes() const { return total_; }

private:
    size_t max_bytes_;
    size_t total_;
    std::string data_;
};

// Line-oriented reader for the worker's report stream. When a token is
// set, records that do not carry it are ignored: the guest shares the
// worker's descriptors and could otherwise write records of its own.
class ReportChannel {
public:
    explicit ReportChannel(const std::string& token = std::string());

    void feed(const char* data, size_t len);

    // Parse a trailing record that was not newline-terminated
    void finish();

    bool ready() const { return ready_; }
    bool landlock() const { return landlock_; }
    bool has_violation() const { return has_violation_; }
    const protocol::ReportRecord& violation() const { return violation_; }
    bool has_finished() const { return has_finished_; }
    const protocol::ReportRecord& finished() const { return finished_; }
    bool setup_failed() const { return setup_failed_; }
    const std::string& setup_message() const { return setup_message_; }
    int malformed_records() const { return malformed_; }

private:
    void handle_line(const std::string& line);

    std::string token_;
    std::string pending_;
    bool overflow_;
    bool ready_;
    bool landlock_;
    bool has_violation_;
    protocol::ReportRecord violation_;
    bool has_finished_;
    protocol::ReportRecord finished_;
    bool setup_failed_;
    std::string setup_message_;
    int malformed_;
};

class ResultCollector {
public:
    ResultCollector(const ResourceLimits& limits, const std::string& report_token);

    StreamCapture& stdout_capture() { return stdout_; }
    StreamCapture& stderr_capture() { return stderr_; }
    ReportChannel& report() { return report_; }

    // Classify the run. Never throws; every run yields one outcome.
    ExecutionOutcome finish(const SupervisionResult& supervision) const;

    // Outcome for a worker that could not be started at all
    static ExecutionOutcome launch_failure(const std::string& message);

    static std::string timeout_message(double timeout_seconds);
    static std::string memory_message(int64_t memory_mb);

private:
    ExecutionOutcome classify(const SupervisionResult& supervision) const;

    ResourceLimits limits_;
    StreamCapture stdout_;
    StreamCapture stderr_;
    ReportChannel report_;
};

} // namespace scriptcell

#endif // scriptcell_CORE_RESULT_COLLECTOR_HPP
