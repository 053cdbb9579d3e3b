/*
 * ScriptCell C++ - JSON type
 */
#ifndef scriptcell_CORE_JSON_HPP
#define scriptcell_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace scriptcell {

typedef nlohmann::json Json;

// Serialize for the wire. Guest output is arbitrary bytes, so invalid UTF-8
// is replaced instead of throwing.
inline std::string dump_json(const Json& value, int indent = -1) {
    return value.dump(indent, ' ', false, Json::error_handler_t::replace);
}

} // namespace scriptcell

#endif // scriptcell_CORE_JSON_HPP
