/*
 * ScriptCell C++ - Filesystem Jail Implementation (Landlock)
 *
 * Landlock is unprivileged (no root/capabilities needed) and available
 * since Linux 5.13. Every filesystem right is handled by the ruleset and
 * only read rights are ever granted, so once active the process can
 * neither write nor execute anything.
 */
#include <scriptcell/core/sandbox.hpp>
#include <scriptcell/core/logger.hpp>

#include <cstring>
#include <cerrno>
#include <sys/prctl.h>
#include <unistd.h>
#include <fcntl.h>

// ============================================================================
// Landlock syscall wrappers (not in glibc until very recently)
// ============================================================================

#ifdef __linux__

#include <linux/landlock.h>
#include <sys/syscall.h>

#ifndef __NR_landlock_create_ruleset
#define __NR_landlock_create_ruleset 444
#endif
#ifndef __NR_landlock_add_rule
#define __NR_landlock_add_rule 445
#endif
#ifndef __NR_landlock_restrict_self
#define __NR_landlock_restrict_self 446
#endif

// Ensure struct definitions exist (for older headers)
#ifndef LANDLOCK_ACCESS_FS_EXECUTE

#define LANDLOCK_ACCESS_FS_EXECUTE          (1ULL << 0)
#define LANDLOCK_ACCESS_FS_WRITE_FILE       (1ULL << 1)
#define LANDLOCK_ACCESS_FS_READ_FILE        (1ULL << 2)
#define LANDLOCK_ACCESS_FS_READ_DIR         (1ULL << 3)
#define LANDLOCK_ACCESS_FS_REMOVE_DIR       (1ULL << 4)
#define LANDLOCK_ACCESS_FS_REMOVE_FILE      (1ULL << 5)
#define LANDLOCK_ACCESS_FS_MAKE_CHAR        (1ULL << 6)
#define LANDLOCK_ACCESS_FS_MAKE_DIR         (1ULL << 7)
#define LANDLOCK_ACCESS_FS_MAKE_REG         (1ULL << 8)
#define LANDLOCK_ACCESS_FS_MAKE_SOCK        (1ULL << 9)
#define LANDLOCK_ACCESS_FS_MAKE_FIFO        (1ULL << 10)
#define LANDLOCK_ACCESS_FS_MAKE_BLOCK       (1ULL << 11)
#define LANDLOCK_ACCESS_FS_MAKE_SYM         (1ULL << 12)

#define LANDLOCK_RULE_PATH_BENEATH 1

struct landlock_ruleset_attr {
    __u64 handled_access_fs;
};

struct landlock_path_beneath_attr {
    __u64 allowed_access;
    __s32 parent_fd;
} __attribute__((packed));

#endif // LANDLOCK_ACCESS_FS_EXECUTE

// All filesystem access rights (Landlock ABI v1)
#define LANDLOCK_ACCESS_FS_ALL ( \
    LANDLOCK_ACCESS_FS_EXECUTE          | \
    LANDLOCK_ACCESS_FS_WRITE_FILE       | \
    LANDLOCK_ACCESS_FS_READ_FILE        | \
    LANDLOCK_ACCESS_FS_READ_DIR         | \
    LANDLOCK_ACCESS_FS_REMOVE_DIR       | \
    LANDLOCK_ACCESS_FS_REMOVE_FILE      | \
    LANDLOCK_ACCESS_FS_MAKE_CHAR        | \
    LANDLOCK_ACCESS_FS_MAKE_DIR         | \
    LANDLOCK_ACCESS_FS_MAKE_REG         | \
    LANDLOCK_ACCESS_FS_MAKE_SOCK        | \
    LANDLOCK_ACCESS_FS_MAKE_FIFO        | \
    LANDLOCK_ACCESS_FS_MAKE_BLOCK       | \
    LANDLOCK_ACCESS_FS_MAKE_SYM         \
)

// No EXECUTE: nothing may be exec'd once the jail is active. Shared
// libraries still load, mmap is not an execve.
#define LANDLOCK_ACCESS_FS_READ_ONLY ( \
    LANDLOCK_ACCESS_FS_READ_FILE        | \
    LANDLOCK_ACCESS_FS_READ_DIR         \
)

static inline int landlock_create_ruleset(
    const struct landlock_ruleset_attr* attr,
    size_t size, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_create_ruleset, attr, size, flags));
}

static inline int landlock_add_rule(
    int ruleset_fd, enum landlock_rule_type type,
    const void* attr, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_add_rule, ruleset_fd, type, attr, flags));
}

static inline int landlock_restrict_self(int ruleset_fd, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_restrict_self, ruleset_fd, flags));
}

// ============================================================================
// seccomp-bpf process filter
// ============================================================================

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sched.h>
#include <stddef.h>

#ifndef SECCOMP_RET_KILL_PROCESS
#define SECCOMP_RET_KILL_PROCESS 0x80000000U
#endif

#if defined(__x86_64__)
#define SCRIPTCELL_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
#define SCRIPTCELL_AUDIT_ARCH AUDIT_ARCH_AARCH64
#endif

struct FilteredSyscall {
    int nr;
    const char* name;
};

// Trapped unconditionally. clone is handled apart, by its flags.
static const FilteredSyscall PROCESS_SYSCALLS[] = {
#ifdef __NR_fork
    { __NR_fork, "fork" },
#endif
#ifdef __NR_vfork
    { __NR_vfork, "vfork" },
#endif
    { __NR_execve, "execve" },
#ifdef __NR_execveat
    { __NR_execveat, "execveat" },
#endif
    { -1, NULL }
};

static inline struct sock_filter bpf_stmt(unsigned short code, __u32 k) {
    struct sock_filter insn = BPF_STMT(code, k);
    return insn;
}

static inline struct sock_filter bpf_jump(unsigned short code, __u32 k, unsigned char jt, unsigned char jf) {
    struct sock_filter insn = BPF_JUMP(code, k, jt, jf);
    return insn;
}

#endif // __linux__

namespace scriptcell {

// ============================================================================
// Sandbox Implementation
// ============================================================================

Sandbox& Sandbox::instance() {
    static Sandbox s;
    return s;
}

Sandbox::Sandbox()
    : active_(false)
    , supported_(false)
    , process_filter_active_(false)
{
#ifdef __linux__
    // Probe for Landlock support
    struct landlock_ruleset_attr attr;
    memset(&attr, 0, sizeof(attr));
    attr.handled_access_fs = LANDLOCK_ACCESS_FS_ALL;
    int fd = landlock_create_ruleset(&attr, sizeof(attr), 0);
    if (fd >= 0) {
        supported_ = true;
        close(fd);
    }
#endif
}

void Sandbox::allow_read_only(const std::string& path) {
    if (!active_ && !path.empty()) {
        readonly_paths_.push_back(path);
    }
}

bool Sandbox::activate() {
    if (active_) return true;

#ifndef __linux__
    last_error_ = "Landlock is only available on Linux";
    LOG_WARN("[Sandbox] %s. Jail NOT active.", last_error_.c_str());
    return false;
#else
    if (!supported_) {
        last_error_ = "Landlock not supported by this kernel";
        LOG_WARN("[Sandbox] %s. Jail NOT active.", last_error_.c_str());
        return false;
    }

    // 1. Create a Landlock ruleset handling all FS access types
    struct landlock_ruleset_attr ruleset_attr;
    memset(&ruleset_attr, 0, sizeof(ruleset_attr));
    ruleset_attr.handled_access_fs = LANDLOCK_ACCESS_FS_ALL;

    int ruleset_fd = landlock_create_ruleset(&ruleset_attr, sizeof(ruleset_attr), 0);
    if (ruleset_fd < 0) {
        last_error_ = std::string("Failed to create Landlock ruleset: ") + strerror(errno);
        LOG_ERROR("[Sandbox] %s", last_error_.c_str());
        return false;
    }

    auto add_ro_rule = [&](const std::string& dir_path) -> bool {
        int dir_fd = open(dir_path.c_str(), O_PATH | O_CLOEXEC);
        if (dir_fd < 0) {
            // Not critical if path doesn't exist
            return false;
        }

        struct landlock_path_beneath_attr path_attr;
        memset(&path_attr, 0, sizeof(path_attr));
        path_attr.allowed_access = LANDLOCK_ACCESS_FS_READ_ONLY;
        path_attr.parent_fd = dir_fd;

        int ret = landlock_add_rule(ruleset_fd,
                                     LANDLOCK_RULE_PATH_BENEATH,
                                     &path_attr, 0);
        close(dir_fd);
        return ret == 0;
    };

    // 2. Read-only access to the paths the interpreter may still need
    //    (lazily loaded stdlib files, shared libraries)
    for (size_t i = 0; i < readonly_paths_.size(); ++i) {
        if (add_ro_rule(readonly_paths_[i])) {
            LOG_DEBUG("[Sandbox] Allowed R/O: %s", readonly_paths_[i].c_str());
        }
    }

    // 3. Prevent gaining new privileges (required before restrict_self)
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
        last_error_ = std::string("Failed to set no_new_privs: ") + strerror(errno);
        LOG_ERROR("[Sandbox] %s", last_error_.c_str());
        close(ruleset_fd);
        return false;
    }

    // 4. Enforce the ruleset on this process (and all future children)
    if (landlock_restrict_self(ruleset_fd, 0) < 0) {
        last_error_ = std::string("Failed to restrict self: ") + strerror(errno);
        LOG_ERROR("[Sandbox] %s", last_error_.c_str());
        close(ruleset_fd);
        return false;
    }

    close(ruleset_fd);
    active_ = true;
    last_error_.clear();

    LOG_INFO("[Sandbox] Landlock jail active, %zu read-only path(s)", readonly_paths_.size());
    return true;
#endif // __linux__
}

const char* Sandbox::filtered_syscall_name(int nr) {
#ifdef __linux__
    if (nr == __NR_clone) return "clone";
    for (int i = 0; PROCESS_SYSCALLS[i].name != NULL; ++i) {
        if (PROCESS_SYSCALLS[i].nr == nr) return PROCESS_SYSCALLS[i].name;
    }
#else
    (void)nr;
#endif
    return NULL;
}

bool Sandbox::deny_process_creation() {
    if (process_filter_active_) return true;

#if !defined(__linux__) || !defined(SCRIPTCELL_AUDIT_ARCH)
    last_error_ = "seccomp filtering is not available on this platform";
    LOG_WARN("[Sandbox] %s", last_error_.c_str());
    return false;
#else
    std::vector<struct sock_filter> program;

    // Any other ABI (x32, compat) ends the process outright
    program.push_back(bpf_stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    program.push_back(bpf_jump(BPF_JMP | BPF_JEQ | BPF_K, SCRIPTCELL_AUDIT_ARCH, 1, 0));
    program.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));

    program.push_back(bpf_stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));
#ifdef __X32_SYSCALL_BIT
    program.push_back(bpf_jump(BPF_JMP | BPF_JGE | BPF_K, __X32_SYSCALL_BIT, 0, 1));
    program.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
#endif

    for (int i = 0; PROCESS_SYSCALLS[i].name != NULL; ++i) {
        program.push_back(bpf_jump(BPF_JMP | BPF_JEQ | BPF_K,
                                                       static_cast<__u32>(PROCESS_SYSCALLS[i].nr), 0, 1));
        program.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_TRAP));
    }

    // clone3 keeps its flags in memory the filter cannot read; libc falls
    // back to clone on ENOSYS
#ifdef __NR_clone3
    program.push_back(bpf_jump(BPF_JMP | BPF_JEQ | BPF_K, __NR_clone3, 0, 1));
    program.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (ENOSYS & SECCOMP_RET_DATA)));
#endif

    // clone: a new thread passes, a new process traps. The flags are the
    // first argument on both supported architectures (low word).
    program.push_back(bpf_jump(BPF_JMP | BPF_JEQ | BPF_K, __NR_clone, 0, 3));
    program.push_back(bpf_stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, args[0])));
    program.push_back(bpf_jump(BPF_JMP | BPF_JSET | BPF_K, CLONE_THREAD, 1, 0));
    program.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_TRAP));

    program.push_back(bpf_stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    struct sock_fprog prog;
    memset(&prog, 0, sizeof(prog));
    prog.len = static_cast<unsigned short>(program.size());
    prog.filter = program.data();

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
        last_error_ = std::string("Failed to set no_new_privs: ") + strerror(errno);
        LOG_ERROR("[Sandbox] %s", last_error_.c_str());
        return false;
    }

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) < 0) {
        last_error_ = std::string("Failed to install seccomp filter: ") + strerror(errno);
        LOG_ERROR("[Sandbox] %s", last_error_.c_str());
        return false;
    }

    process_filter_active_ = true;
    last_error_.clear();

    LOG_INFO("[Sandbox] Process creation filter active");
    return true;
#endif
}

} // namespace scriptcell
