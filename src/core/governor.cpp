/*
 * ScriptCell C++ - Resource Governor Implementation
 */
#include <scriptcell/core/governor.hpp>
#include <scriptcell/core/result_collector.hpp>
#include <scriptcell/core/logger.hpp>
#include <scriptcell/core/utils.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <poll.h>
#include <unistd.h>

namespace scriptcell {

namespace {

enum StreamId {
    STREAM_STDOUT,
    STREAM_STDERR,
    STREAM_REPORT,
    STREAM_REQUEST
};

// Read whatever is available on fd into the collector.
// Returns false once the stream reached EOF or failed.
bool pump(int fd, StreamId id, ResultCollector& collector) {
    char buffer[65536];
    for (;;) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            if (id == STREAM_STDOUT) {
                collector.stdout_capture().append(buffer, static_cast<size_t>(n));
            } else if (id == STREAM_STDERR) {
                collector.stderr_capture().append(buffer, static_cast<size_t>(n));
            } else {
                collector.report().feed(buffer, static_cast<size_t>(n));
            }
            // Yield after a full buffer so one busy stream cannot starve the others
            if (static_cast<size_t>(n) == sizeof(buffer)) return true;
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        LOG_WARN("[Governor] read failed on stream %d: %s", static_cast<int>(id), strerror(errno));
        return false;
    }
}

void close_stream(WorkerProcess& worker, StreamId id) {
    switch (id) {
        case STREAM_STDOUT: worker.close_stdout(); break;
        case STREAM_STDERR: worker.close_stderr(); break;
        case STREAM_REPORT: worker.close_report(); break;
        case STREAM_REQUEST: worker.close_request(); break;
    }
}

} // anonymous namespace

ResourceGovernor::ResourceGovernor(const ResourceLimits& limits)
    : limits_(limits) {}

int64_t ResourceGovernor::read_rss_bytes(pid_t pid) {
    std::ifstream status_file(("/proc/" + std::to_string(pid) + "/status").c_str());
    if (!status_file.is_open()) return -1;

    std::string line;
    while (std::getline(status_file, line)) {
        if (line.compare(0, 6, "VmRSS:") == 0) {
            int64_t kb = 0;
            std::istringstream iss(line.substr(6));
            iss >> kb;
            return kb * 1024;
        }
    }
    return -1;
}

SupervisionResult ResourceGovernor::supervise(WorkerProcess& worker,
                                              const std::string& request_payload,
                                              ResultCollector& collector) const {
    SupervisionResult result;
    const int64_t start = monotonic_ms();
    const int64_t deadline = start + limits_.timeout_ms();
    size_t written = 0;

    if (request_payload.empty()) {
        worker.close_request();
        result.request_delivered = true;
    }

    for (;;) {
        // The worker exiting closes its ends; keep pumping until every
        // stream is at EOF so nothing already written is lost.
        bool outputs_open = worker.stdout_fd() >= 0 || worker.stderr_fd() >= 0 || worker.report_fd() >= 0;
        if (!outputs_open && worker.try_reap()) {
            break;
        }

        int64_t now = monotonic_ms();
        if (now >= deadline) {
            result.verdict = GovernorVerdict::TIMED_OUT;
            LOG_INFO("[Governor] pid %d exceeded %.1fs wall clock, killing",
                     static_cast<int>(worker.pid()), limits_.timeout_seconds);
            worker.kill_group();
            break;
        }

        int64_t rss = read_rss_bytes(worker.pid());
        if (rss > result.peak_rss_bytes) {
            result.peak_rss_bytes = rss;
        }
        if (rss > limits_.memory_bytes) {
            result.verdict = GovernorVerdict::MEMORY_EXCEEDED;
            LOG_INFO("[Governor] pid %d resident set %lld bytes over ceiling, killing",
                     static_cast<int>(worker.pid()), static_cast<long long>(rss));
            worker.kill_group();
            break;
        }

        struct pollfd fds[4];
        StreamId ids[4];
        int nfds = 0;

        if (worker.stdout_fd() >= 0) {
            fds[nfds].fd = worker.stdout_fd(); fds[nfds].events = POLLIN; ids[nfds++] = STREAM_STDOUT;
        }
        if (worker.stderr_fd() >= 0) {
            fds[nfds].fd = worker.stderr_fd(); fds[nfds].events = POLLIN; ids[nfds++] = STREAM_STDERR;
        }
        if (worker.report_fd() >= 0) {
            fds[nfds].fd = worker.report_fd(); fds[nfds].events = POLLIN; ids[nfds++] = STREAM_REPORT;
        }
        if (worker.request_fd() >= 0) {
            fds[nfds].fd = worker.request_fd(); fds[nfds].events = POLLOUT; ids[nfds++] = STREAM_REQUEST;
        }

        int64_t remaining = deadline - now;
        int wait_ms = static_cast<int>(remaining < limits_.poll_interval_ms ? remaining : limits_.poll_interval_ms);
        if (wait_ms < 1) wait_ms = 1;

        int ready = poll(nfds > 0 ? fds : NULL, static_cast<nfds_t>(nfds), wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("[Governor] poll failed: %s", strerror(errno));
            worker.kill_group();
            break;
        }

        for (int i = 0; i < nfds; ++i) {
            if (fds[i].revents == 0) continue;

            if (ids[i] == STREAM_REQUEST) {
                if (fds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) {
                    // Worker is gone or closed its request end early
                    worker.close_request();
                    continue;
                }
                ssize_t n = write(worker.request_fd(),
                                  request_payload.data() + written,
                                  request_payload.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                    if (written == request_payload.size()) {
                        worker.close_request();
                        result.request_delivered = true;
                    }
                } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    LOG_WARN("[Governor] request delivery failed: %s", strerror(errno));
                    worker.close_request();
                }
                continue;
            }

            if (!pump(fds[i].fd, ids[i], collector)) {
                close_stream(worker, ids[i]);
            }
        }
    }

    // Killed or exited: reap, then drain what is still buffered in the pipes
    worker.close_request();
    worker.reap();

    StreamId outputs[] = { STREAM_STDOUT, STREAM_STDERR, STREAM_REPORT };
    for (int i = 0; i < 3; ++i) {
        int fd = outputs[i] == STREAM_STDOUT ? worker.stdout_fd()
               : outputs[i] == STREAM_STDERR ? worker.stderr_fd()
               : worker.report_fd();
        if (fd < 0) continue;
        // The group is dead, so every write end is closed and pump sees EOF
        // after the buffered bytes, unless something outside the group still
        // holds a write end; bound the drain in that case.
        for (int rounds = 0; rounds < 1024 && pump(fd, outputs[i], collector); ++rounds) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLIN;
            if (poll(&pfd, 1, 0) <= 0) break;
        }
        close_stream(worker, outputs[i]);
    }
    collector.report().finish();

    result.exit = worker.exit_info();
    result.duration_ms = monotonic_ms() - start;
    return result;
}

} // namespace scriptcell
