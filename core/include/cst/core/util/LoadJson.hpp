// LoadJson.hpp - JSON loading and safe access helpers
#pragma once

#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <string>

namespace cst::json {

/**
 * Parse a JSON file.
 * @throws std::runtime_error if the file is missing, unreadable or malformed
 */
nlohmann::json load_json_file(const std::filesystem::path& path);

// ============ SAFE ACCESS HELPERS ============

// Returns a number if present (float/int or string convertible), else def.
double number_or(const nlohmann::json* m, const char* key, double def);

// Returns a bool if present (bool, or 0/1 integer), else def.
bool bool_or(const nlohmann::json* m, const char* key, bool def);

// Returns a string if present and of string type, else def.
std::string string_or(const nlohmann::json* m, const char* key, const std::string& def);

// Returns the nested object under key, or nullptr if absent or not an object.
const nlohmann::json* object_or_null(const nlohmann::json* m, const char* key);

} // namespace cst::json
