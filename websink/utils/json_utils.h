/*
 * JSON Utilities
 *
 * Thin helpers over nlohmann/json for the signaling body and the config
 * file: non-throwing parse, and typed member lookups that fall back to a
 * default when the member is missing or has the wrong type.
 */

#ifndef JSON_UTILS_H
#define JSON_UTILS_H

#include <nlohmann/json.hpp>
#include <string>

namespace json_utils {

using json = nlohmann::json;

// false if str is not valid JSON; out is untouched then
bool try_parse(const std::string& str, json* out);

/**
 * Read and parse a JSON file
 * @throws std::runtime_error naming the file on open or parse failure
 */
json parse_file(const std::string& path);

// Compact (indent < 0) or pretty-printed text
std::string to_string(const json& j, int indent = -1);

// Typed lookups on an object member
std::string get_string(const json& j, const std::string& key,
                       const std::string& default_val = "");
int get_int(const json& j, const std::string& key, int default_val = 0);
bool get_bool(const json& j, const std::string& key, bool default_val = false);

} // namespace json_utils

#endif // JSON_UTILS_H
