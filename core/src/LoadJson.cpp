#include "cst/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

namespace cst::json {

nlohmann::json load_json_file(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("JSON file not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open JSON file: " + path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

double number_or(const nlohmann::json* m, const char* key, double def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it == m->end()) return def;
    if (it->is_number_float())   return it->get<double>();
    if (it->is_number_integer()) return static_cast<double>(it->get<int64_t>());
    if (it->is_string()) {
        try {
            return std::stod(it->get<std::string>());
        } catch (const std::logic_error&) {
            throw std::runtime_error(std::string("JSON field '") + key + "' is not a number");
        }
    }
    throw std::runtime_error(std::string("JSON field '") + key + "' is not a number");
}

bool bool_or(const nlohmann::json* m, const char* key, bool def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it == m->end()) return def;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number_integer()) return it->get<int64_t>() != 0;
    throw std::runtime_error(std::string("JSON field '") + key + "' is not a boolean");
}

std::string string_or(const nlohmann::json* m, const char* key, const std::string& def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it != m->end() && it->is_string()) return it->get<std::string>();
    return def;
}

const nlohmann::json* object_or_null(const nlohmann::json* m, const char* key) {
    if (!m || !m->is_object()) return nullptr;
    auto it = m->find(key);
    if (it == m->end() || !it->is_object()) return nullptr;
    return &(*it);
}

} // namespace cst::json
