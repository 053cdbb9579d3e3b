/*
 * ScriptCell C++ - Configuration Implementation
 */
#include <scriptcell/core/config.hpp>
#include <scriptcell/core/utils.hpp>

#include <fstream>
#include <sstream>

namespace scriptcell {

Config::Config() : root_(Json::object()) {}

Config::Config(const Json& root) : root_(root.is_object() ? root : Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        last_error_ = "cannot open " + path;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

bool Config::load_string(const std::string& text) {
    Json parsed;
    try {
        parsed = Json::parse(text);
    } catch (const std::exception& e) {
        last_error_ = e.what();
        return false;
    }
    if (!parsed.is_object()) {
        last_error_ = "configuration root must be a JSON object";
        return false;
    }
    root_ = parsed;
    last_error_.clear();
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::find_or_create(const std::string& key) {
    Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* v = find(key);
    if (!v || !v->is_string()) return def;
    return v->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* v = find(key);
    if (!v || !v->is_number()) return def;
    if (v->is_number_float()) {
        return static_cast<int64_t>(v->get<double>());
    }
    return v->get<int64_t>();
}

double Config::get_double(const std::string& key, double def) const {
    const Json* v = find(key);
    if (!v || !v->is_number()) return def;
    return v->get<double>();
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* v = find(key);
    if (!v || !v->is_boolean()) return def;
    return v->get<bool>();
}

std::vector<std::string> Config::get_string_list(const std::string& key,
                                                 const std::vector<std::string>& def) const {
    const Json* v = find(key);
    if (!v || !v->is_array()) return def;

    std::vector<std::string> out;
    for (const auto& item : *v) {
        if (!item.is_string()) return def;
        out.push_back(item.get<std::string>());
    }
    return out;
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

void Config::set_string(const std::string& key, const std::string& value) {
    find_or_create(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    find_or_create(key) = value;
}

} // namespace scriptcell
