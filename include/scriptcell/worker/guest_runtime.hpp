/*
 * ScriptCell C++ - Guest Runtime
 *
 * Embeds CPython inside the worker and runs exactly one guest program
 * under the capability policy:
 *   - builtins.__import__ is replaced; imports requested by the guest are
 *     checked against the allow-list, imports a permitted module performs
 *     while loading are not
 *   - an audit hook checks every audited operation against the deny-list
 *   - _imp.create_builtin and _imp.create_dynamic are replaced, so a module
 *     reached through the import machinery directly is still checked
 *   - once guest code runs, the first denial writes a violation record and
 *     ends the process, so a guest cannot catch the error and keep probing
 *   - while guest code runs, an allocation the memory limit refuses ends
 *     the process with a memory record instead of raising MemoryError
 *   - a seccomp filter traps process creation; the SIGSYS handler reports
 *     it as a denied operation named after the syscall
 *
 * Everything the interpreter needs is loaded before the filesystem jail
 * closes and before the hooks are armed.
 */
#ifndef scriptcell_WORKER_GUEST_RUNTIME_HPP
#define scriptcell_WORKER_GUEST_RUNTIME_HPP

#include "protocol.hpp"
#include <scriptcell/core/policy.hpp>
#include <string>

// Keeps Python.h out of this header
typedef struct _object PyObject;

namespace scriptcell {
namespace worker {

enum class GuestPhase {
    SETUP,      // Interpreter bring-up, nothing is checked
    GUEST,      // Guest code running, a denial ends the process
    REPORTING   // Formatting the result, a denial raises PermissionError
};

class GuestRuntime {
public:
    explicit GuestRuntime(const protocol::WorkerRequest& request);

    // Set up the interpreter and run the guest. Returns the status the
    // worker should exit with once the outcome has been reported.
    int run();

    // Hook entry points, called with the GIL held
    PyObject* guarded_import(PyObject* args, PyObject* kwargs);
    PyObject* guarded_create(bool dynamic, PyObject* args);
    int audit(const char* event, PyObject* args);

    // Write one record to the report stream
    void send(protocol::ReportRecord record) const;

    GuestPhase phase() const { return phase_; }

private:
    GuestRuntime(const GuestRuntime&);
    GuestRuntime& operator=(const GuestRuntime&);

    bool initialize_interpreter(std::string& error);
    bool install_hooks(std::string& error);
    bool warm_up(std::string& error);
    bool register_source(std::string& error);
    bool guard_module_creation(std::string& error);
    PyObject* compile_guest(std::string& syntax_error);
    bool confine(bool& landlock, std::string& error);
    void guard_allocations();
    int execute(PyObject* code);

    int finish(protocol::FinishStatus status, int exit_code, const std::string& exception);
    int finish_system_exit(PyObject* value);
    int fail_setup(const std::string& message);

    int deny(CapabilityError error, const std::string& name);
    bool is_direct_request(PyObject* globals) const;
    bool allowed_while_importing(const std::string& event, PyObject* args) const;
    std::string format_exception(PyObject* type, PyObject* value);

    protocol::WorkerRequest request_;
    CapabilityPolicy policy_;
    GuestPhase phase_;
    int import_depth_;
    PyObject* builtins_;
    PyObject* original_import_;
    PyObject* format_exception_;
    PyObject* guest_code_;
    bool guest_code_started_;
    PyObject* create_builtin_;     // Originals, reachable only from here
    PyObject* create_dynamic_;
    PyObject* spec_type_;
};

} // namespace worker
} // namespace scriptcell

#endif // scriptcell_WORKER_GUEST_RUNTIME_HPP
