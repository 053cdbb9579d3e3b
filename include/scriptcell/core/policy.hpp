/*
 * ScriptCell C++ - Capability Policy
 *
 * The allow-list of importable module names and the deny-list of operation
 * names. Operation names are the CPython audit event names raised at the
 * point where the capability is acquired ("open", "compile", "exec",
 * "os.system", "subprocess.Popen", ...).
 *
 * Constructed once at startup and shared read-only by every execution.
 */
#ifndef scriptcell_CORE_POLICY_HPP
#define scriptcell_CORE_POLICY_HPP

#include <set>
#include <string>
#include <vector>

namespace scriptcell {

class Config;

enum class CapabilityError {
    NONE,
    MODULE_DENIED,
    OPERATION_DENIED
};

const char* capability_error_name(CapabilityError error);

class CapabilityPolicy {
public:
    // Default allow-list and deny-list
    CapabilityPolicy();
    CapabilityPolicy(const std::vector<std::string>& allowed_modules,
                     const std::vector<std::string>& denied_operations);

    // policy.allowed_modules / policy.denied_operations, defaults otherwise
    static CapabilityPolicy from_config(const Config& cfg);

    static std::vector<std::string> default_allowed_modules();
    static std::vector<std::string> default_denied_operations();

    // Exact match. "json" does not allow "json.decoder" or anything json uses.
    bool is_module_allowed(const std::string& name) const;

    // Exact match against the deny-list
    bool is_operation_denied(const std::string& name) const;

    const std::set<std::string>& allowed_modules() const { return allowed_modules_; }
    const std::set<std::string>& denied_operations() const { return denied_operations_; }

    // Text surfaced to the caller for a violation
    static std::string violation_message(CapabilityError error, const std::string& name);

private:
    std::set<std::string> allowed_modules_;
    std::set<std::string> denied_operations_;
};

} // namespace scriptcell

#endif // scriptcell_CORE_POLICY_HPP
