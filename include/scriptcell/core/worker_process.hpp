/*
 * ScriptCell C++ - Worker Process
 *
 * One isolated execution unit: a fork+exec'd scriptcell-worker with its own
 * address space, process group, rlimits, empty environment and only the
 * protocol descriptors (see worker/protocol.hpp).
 *
 * The destructor kills and reaps a worker that is still running.
 */
#ifndef scriptcell_CORE_WORKER_PROCESS_HPP
#define scriptcell_CORE_WORKER_PROCESS_HPP

#include "limits.hpp"
#include <string>
#include <sys/types.h>

namespace scriptcell {

struct WorkerExit {
    bool reaped;
    bool exited;        // Normal exit, status in exit_status
    int exit_status;
    bool signaled;      // Killed by term_signal
    int term_signal;

    WorkerExit() : reaped(false), exited(false), exit_status(0), signaled(false), term_signal(0) {}

    static WorkerExit from_wait_status(int status);
};

class WorkerProcess {
public:
    WorkerProcess();
    ~WorkerProcess();

    // Spawn the worker. On failure returns false with a description in error.
    bool start(const std::string& worker_path, const ResourceLimits& limits, std::string& error);

    pid_t pid() const { return pid_; }
    bool running() const { return pid_ > 0 && !exit_.reaped; }

    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }
    int request_fd() const { return request_fd_; }
    int report_fd() const { return report_fd_; }

    void close_stdout() { close_fd(stdout_fd_); }
    void close_stderr() { close_fd(stderr_fd_); }
    void close_request() { close_fd(request_fd_); }
    void close_report() { close_fd(report_fd_); }

    // SIGKILL the worker's whole process group. Does not wait.
    bool kill_group();

    // Non-blocking reap; true once the worker has been reaped
    bool try_reap();

    // Blocking reap
    void reap();

    const WorkerExit& exit_info() const { return exit_; }

private:
    WorkerProcess(const WorkerProcess&);
    WorkerProcess& operator=(const WorkerProcess&);

    static void close_fd(int& fd);

    pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    int request_fd_;
    int report_fd_;
    WorkerExit exit_;
};

} // namespace scriptcell

#endif // scriptcell_CORE_WORKER_PROCESS_HPP
