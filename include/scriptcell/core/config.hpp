/*
 * ScriptCell C++ - Configuration
 *
 * JSON configuration file with dotted-key lookups:
 *   cfg.get_int("limits.timeout_seconds", 30)
 * reads {"limits": {"timeout_seconds": ...}}.
 */
#ifndef scriptcell_CORE_CONFIG_HPP
#define scriptcell_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace scriptcell {

class Config {
public:
    Config();
    explicit Config(const Json& root);

    // Load from a file. Returns false (and keeps the previous content)
    // if the file cannot be read or is not a JSON object.
    bool load_file(const std::string& path);

    // Load from an in-memory JSON document
    bool load_string(const std::string& text);

    std::string get_string(const std::string& key, const std::string& def) const;
    int64_t get_int(const std::string& key, int64_t def) const;
    double get_double(const std::string& key, double def) const;
    bool get_bool(const std::string& key, bool def) const;

    // Returns def unless the key holds an array of strings
    std::vector<std::string> get_string_list(const std::string& key,
                                             const std::vector<std::string>& def) const;

    bool has(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);

    const Json& root() const { return root_; }
    const std::string& last_error() const { return last_error_; }

private:
    const Json* find(const std::string& key) const;
    Json& find_or_create(const std::string& key);

    Json root_;
    std::string last_error_;
};

} // namespace scriptcell

#endif // scriptcell_CORE_CONFIG_HPP
