/*
 * JSON Utilities Implementation
 */

#include "json_utils.h"
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace json_utils {

// Member of an object, or nullptr
static const json* member(const json& j, const std::string& key) {
    if (!j.is_object()) return nullptr;
    auto it = j.find(key);
    return it != j.end() ? &*it : nullptr;
}

bool try_parse(const std::string& str, json* out) {
    json parsed = json::parse(str, nullptr, false);
    if (parsed.is_discarded()) return false;
    *out = std::move(parsed);
    return true;
}

json parse_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open " + path);
    }
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

std::string to_string(const json& j, int indent) {
    return j.dump(indent);
}

std::string get_string(const json& j, const std::string& key, const std::string& default_val) {
    const json* value = member(j, key);
    return value && value->is_string() ? value->get<std::string>() : default_val;
}

int get_int(const json& j, const std::string& key, int default_val) {
    const json* value = member(j, key);
    if (!value || !value->is_number_integer()) return default_val;

    // Out-of-range values are treated like a wrong type
    int64_t n = value->get<int64_t>();
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
        return default_val;
    }
    return static_cast<int>(n);
}

bool get_bool(const json& j, const std::string& key, bool default_val) {
    const json* value = member(j, key);
    return value && value->is_boolean() ? value->get<bool>() : default_val;
}

} // namespace json_utils
