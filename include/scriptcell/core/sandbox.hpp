/*
 * ScriptCell C++ - Filesystem Jail (Landlock)
 *
 * Restricts the calling process, and everything it could ever spawn, to
 * read-only access beneath a fixed set of paths using the Linux Landlock
 * LSM. Files that are already open (pipes, /dev/null) are unaffected.
 *
 * A seccomp filter closes process creation: fork, vfork, execve,
 * execveat, and clone without CLONE_THREAD raise SIGSYS in the caller
 * instead of running. The signal's si_syscall names the call.
 *
 * The worker activates both after the interpreter has loaded what it
 * needs and before any guest code runs.
 */
#ifndef scriptcell_CORE_SANDBOX_HPP
#define scriptcell_CORE_SANDBOX_HPP

#include <string>
#include <vector>

namespace scriptcell {

class Sandbox {
public:
    // Singleton access
    static Sandbox& instance();

    // Activate the jail. After this call the process can only read beneath
    // the allowed paths and can write nowhere. Returns true on success or
    // if already active. Returns false on error or when Landlock is not
    // available (but does NOT abort - caller decides policy).
    bool activate();

    bool is_active() const { return active_; }

    // Whether Landlock is supported on this kernel
    bool is_supported() const { return supported_; }

    // Add a path readable after activation (must be called before activate())
    void allow_read_only(const std::string& path);

    const std::vector<std::string>& readonly_paths() const { return readonly_paths_; }

    // Install the process-creation filter. Irreversible; threads can
    // still be started. Returns false when seccomp is unavailable.
    bool deny_process_creation();

    bool is_process_creation_denied() const { return process_filter_active_; }

    // Name of a syscall the filter traps, or NULL for any other number
    static const char* filtered_syscall_name(int nr);

    // Why the last activate() or deny_process_creation() failed
    const std::string& last_error() const { return last_error_; }

private:
    Sandbox();
    Sandbox(const Sandbox&);
    Sandbox& operator=(const Sandbox&);

    bool active_;
    bool supported_;
    bool process_filter_active_;
    std::vector<std::string> readonly_paths_;
    std::string last_error_;
};

} // namespace scriptcell

#endif // scriptcell_CORE_SANDBOX_HPP
