/*
 * ScriptCell C++ - Capability Policy Implementation
 */
#include <scriptcell/core/policy.hpp>
#include <scriptcell/core/config.hpp>

namespace scriptcell {

const char* capability_error_name(CapabilityError error) {
    switch (error) {
        case CapabilityError::MODULE_DENIED: return "module_denied";
        case CapabilityError::OPERATION_DENIED: return "operation_denied";
        default: return "none";
    }
}

std::vector<std::string> CapabilityPolicy::default_allowed_modules() {
    std::vector<std::string> mods;
    // Numeric
    mods.push_back("math");
    // Pseudo-random generation
    mods.push_back("random");
    // Date/time values. _strptime is imported lazily by the C datetime
    // and time modules when parsing.
    mods.push_back("datetime");
    mods.push_back("_strptime");
    // Structured data
    mods.push_back("json");
    // Collections, functional and iteration helpers
    mods.push_back("collections");
    mods.push_back("functools");
    mods.push_back("itertools");
    // Monotonic / wall timing
    mods.push_back("time");
    return mods;
}

std::vector<std::string> CapabilityPolicy::default_denied_operations() {
    static const char* const ops[] = {
        // File handles
        "open",
        // Dynamic code
        "compile",
        "exec",
        "code.__new__",
        "marshal.loads",
        // Shell and process creation
        "os.system",
        "os.exec",
        "os.fork",
        "os.forkpty",
        "os.posix_spawn",
        "os.spawn",
        "os.startfile",
        "subprocess.Popen",
        "pty.spawn",
        // Other processes and the host environment
        "os.kill",
        "os.killpg",
        "os.putenv",
        "os.unsetenv",
        "os.chdir",
        "os.listdir",
        "os.scandir",
        "os.mkdir",
        "os.rmdir",
        "os.remove",
        "os.rename",
        "os.link",
        "os.symlink",
        "os.truncate",
        "os.chmod",
        "os.chown",
        "os.utime",
        // Native code
        "ctypes.dlopen",
        "ctypes.dlsym",
        "ctypes.cdata",
        "ctypes.call_function",
        // Network
        "socket.__new__",
        "socket.connect",
        "socket.bind",
        "socket.getaddrinfo",
        // Interactive and introspection hooks
        "builtins.input",
        "builtins.breakpoint",
        "gc.get_objects",
        "gc.get_referrers",
        "gc.get_referents",
        NULL
    };

    std::vector<std::string> out;
    for (int i = 0; ops[i] != NULL; ++i) {
        out.push_back(ops[i]);
    }
    return out;
}

CapabilityPolicy::CapabilityPolicy() {
    std::vector<std::string> mods = default_allowed_modules();
    std::vector<std::string> ops = default_denied_operations();
    allowed_modules_.insert(mods.begin(), mods.end());
    denied_operations_.insert(ops.begin(), ops.end());
}

CapabilityPolicy::CapabilityPolicy(const std::vector<std::string>& allowed_modules,
                                   const std::vector<std::string>& denied_operations)
    : allowed_modules_(allowed_modules.begin(), allowed_modules.end())
    , denied_operations_(denied_operations.begin(), denied_operations.end()) {}

CapabilityPolicy CapabilityPolicy::from_config(const Config& cfg) {
    return CapabilityPolicy(
        cfg.get_string_list("policy.allowed_modules", default_allowed_modules()),
        cfg.get_string_list("policy.denied_operations", default_denied_operations()));
}

bool CapabilityPolicy::is_module_allowed(const std::string& name) const {
    return allowed_modules_.count(name) > 0;
}

bool CapabilityPolicy::is_operation_denied(const std::string& name) const {
    return denied_operations_.count(name) > 0;
}

std::string CapabilityPolicy::violation_message(CapabilityError error, const std::string& name) {
    switch (error) {
        case CapabilityError::MODULE_DENIED:
            return "CapabilityError: Import of module '" + name + "' is not allowed";
        case CapabilityError::OPERATION_DENIED:
            return "CapabilityError: Operation '" + name + "' is not allowed";
        default:
            return "";
    }
}

} // namespace scriptcell
