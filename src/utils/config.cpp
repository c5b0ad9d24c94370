#include "config.hpp"
#include "rangegate/error.hpp"
#include <cstdlib>
#include <fstream>

namespace rangegate::utils {

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigException("failed to open config file: " + path);
    }

    Config config;
    try {
        file >> config.data_;
    } catch (const json::parse_error& e) {
        throw ConfigException("failed to parse config file: " + std::string(e.what()));
    }

    if (!config.data_.is_object()) {
        throw ConfigException("config file must contain a JSON object: " + path);
    }
    return config;
}

Config Config::load_from_json(const std::string& json_str) {
    Config config;
    try {
        config.data_ = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw ConfigException("failed to parse JSON: " + std::string(e.what()));
    }

    if (!config.data_.is_object()) {
        throw ConfigException("configuration must be a JSON object");
    }
    return config;
}

bool Config::apply_env_override(const std::string& key, const char* env_var) {
    const char* value = std::getenv(env_var);
    if (value == nullptr || *value == '\0') {
        return false;
    }
    data_[key] = std::string(value);
    return true;
}

} // namespace rangegate::utils
