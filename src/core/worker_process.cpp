/*
 * ScriptCell C++ - Worker Process Implementation
 *
 * Between fork() and execve() the child only makes async-signal-safe calls:
 * the host is multi-threaded and any other lock may be held by a thread
 * that no longer exists in the child.
 */
#include <scriptcell/core/worker_process.hpp>
#include <scriptcell/worker/protocol.hpp>
#include <scriptcell/core/logger.hpp>

#include <cerrno>
#include <cmath>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace scriptcell {

namespace {

const rlim_t kMaxOpenFiles = 64;

struct ChildLimits {
    rlim_t address_space;
    rlim_t cpu_soft;
    rlim_t cpu_hard;
};

// Child side only
void set_limit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    setrlimit(resource, &rl);
}

// Child side only: move fd to a descriptor >= 10 so the dup2 sequence onto
// 0..4 cannot clobber a source that happens to live there.
int lift_fd(int fd) {
    return fcntl(fd, F_DUPFD, 10);
}

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

} // anonymous namespace

WorkerExit WorkerExit::from_wait_status(int status) {
    WorkerExit e;
    e.reaped = true;
    if (WIFEXITED(status)) {
        e.exited = true;
        e.exit_status = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        e.signaled = true;
        e.term_signal = WTERMSIG(status);
    }
    return e;
}

WorkerProcess::WorkerProcess()
    : pid_(-1)
    , stdout_fd_(-1)
    , stderr_fd_(-1)
    , request_fd_(-1)
    , report_fd_(-1) {}

WorkerProcess::~WorkerProcess() {
    if (running()) {
        kill_group();
        reap();
    }
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    close_fd(request_fd_);
    close_fd(report_fd_);
}

void WorkerProcess::close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

bool WorkerProcess::start(const std::string& worker_path, const ResourceLimits& limits, std::string& error) {
    if (pid_ > 0) {
        error = "worker already started";
        return false;
    }
    if (access(worker_path.c_str(), X_OK) != 0) {
        error = "worker executable " + worker_path + " is not runnable: " + strerror(errno);
        return false;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int req_pipe[2] = {-1, -1};
    int rep_pipe[2] = {-1, -1};

    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
        pipe2(req_pipe, O_CLOEXEC) != 0 || pipe2(rep_pipe, O_CLOEXEC) != 0) {
        error = std::string("pipe failed: ") + strerror(errno);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        close_pipe(req_pipe);
        close_pipe(rep_pipe);
        return false;
    }

    int dev_null = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (dev_null < 0) {
        error = std::string("cannot open /dev/null: ") + strerror(errno);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        close_pipe(req_pipe);
        close_pipe(rep_pipe);
        return false;
    }

    // Everything the child needs is prepared before fork
    ChildLimits child_limits;
    child_limits.address_space = static_cast<rlim_t>(limits.memory_bytes);
    child_limits.cpu_soft = static_cast<rlim_t>(std::ceil(limits.timeout_seconds)) + 1;
    child_limits.cpu_hard = child_limits.cpu_soft + 1;

    const char* path = worker_path.c_str();
    char* const argv[] = { const_cast<char*>("scriptcell-worker"), NULL };
    char* const envp[] = { NULL };
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536) max_fd = 65536;

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + strerror(errno);
        close(dev_null);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        close_pipe(req_pipe);
        close_pipe(rep_pipe);
        return false;
    }

    if (pid == 0) {
        // ---- child ----
        setpgid(0, 0);
        prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0);

        int src[5];
        src[0] = lift_fd(dev_null);
        src[1] = lift_fd(out_pipe[1]);
        src[2] = lift_fd(err_pipe[1]);
        src[3] = lift_fd(req_pipe[0]);
        src[4] = lift_fd(rep_pipe[1]);
        for (int i = 0; i < 5; ++i) {
            if (src[i] < 0 || dup2(src[i], i) < 0) {
                _exit(protocol::EXIT_EXEC_FAILED);
            }
        }

        // Nothing else crosses into the worker
#ifdef SYS_close_range
        if (syscall(SYS_close_range, 5U, ~0U, 0U) != 0)
#endif
        {
            for (long fd = 5; fd < max_fd; ++fd) {
                close(static_cast<int>(fd));
            }
        }

        signal(SIGPIPE, SIG_DFL);
        sigprocmask(SIG_SETMASK, &empty_mask, NULL);

        set_limit(RLIMIT_AS, child_limits.address_space, child_limits.address_space);
        set_limit(RLIMIT_CPU, child_limits.cpu_soft, child_limits.cpu_hard);
        set_limit(RLIMIT_FSIZE, 0, 0);
        set_limit(RLIMIT_CORE, 0, 0);
        set_limit(RLIMIT_NOFILE, kMaxOpenFiles, kMaxOpenFiles);
        set_limit(RLIMIT_NPROC, 0, 0);

        execve(path, argv, envp);
        _exit(protocol::EXIT_EXEC_FAILED);
    }

    // ---- parent ----
    setpgid(pid, pid);  // Also done by the child; whichever runs first wins

    close(dev_null);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(req_pipe[0]);
    close(rep_pipe[1]);

    pid_ = pid;
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    request_fd_ = req_pipe[1];
    report_fd_ = rep_pipe[0];
    exit_ = WorkerExit();

    int fds[] = { stdout_fd_, stderr_fd_, request_fd_, report_fd_ };
    for (int i = 0; i < 4; ++i) {
        int flags = fcntl(fds[i], F_GETFL);
        if (flags >= 0) fcntl(fds[i], F_SETFL, flags | O_NONBLOCK);
    }

    LOG_DEBUG("[Worker] Started pid %d (%s)", static_cast<int>(pid_), worker_path.c_str());
    return true;
}

bool WorkerProcess::kill_group() {
    if (!running()) return false;

    // Negative pid: the whole group, in case the guest managed to fork
    if (kill(-pid_, SIGKILL) != 0) {
        if (kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
            LOG_ERROR("[Worker] Failed to kill pid %d: %s", static_cast<int>(pid_), strerror(errno));
            return false;
        }
    }
    return true;
}

bool WorkerProcess::try_reap() {
    if (pid_ <= 0) return false;
    if (exit_.reaped) return true;

    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        exit_ = WorkerExit::from_wait_status(status);
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing more to learn
        exit_.reaped = true;
        return true;
    }
    return false;
}

void WorkerProcess::reap() {
    if (pid_ <= 0 || exit_.reaped) return;

    int status = 0;
    for (;;) {
        pid_t r = waitpid(pid_, &status, 0);
        if (r == pid_) {
            exit_ = WorkerExit::from_wait_status(status);
            return;
        }
        if (r < 0 && errno == EINTR) continue;
        exit_.reaped = true;
        return;
    }
}

} // namespace scriptcell
