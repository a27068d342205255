#include "data_ngin/core/config_store.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>

namespace data_ngin {

ConfigStore::ConfigStore(const std::string& path)
    : config_(nlohmann::json::object()), config_path_(path) {
    const char* env_config = std::getenv("DATA_NGIN_CONFIG_PATH");
    if (env_config) {
        std::filesystem::path env_path(env_config);
        if (env_path.extension() == ".json" && env_path.string().length() < 512) {
            config_path_ = env_config;
        }
    }
}

Result<void> ConfigStore::load_config() {
    if (!std::filesystem::exists(config_path_)) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Config file not found: " + config_path_,
                                "ConfigStore");
    }

    std::ifstream config_file(config_path_);
    if (!config_file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open config file: " + config_path_, "ConfigStore");
    }

    nlohmann::json parsed;
    try {
        config_file >> parsed;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Failed to parse config file: " + std::string(e.what()),
                                "ConfigStore");
    }

    if (!parsed.is_object()) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Config file must contain a JSON object: " + config_path_,
                                "ConfigStore");
    }

    config_ = std::move(parsed);
    return Result<void>();
}

void ConfigStore::load_json(const nlohmann::json& document) {
    config_ = document.is_object() ? document : nlohmann::json::object();
}

bool ConfigStore::has(const std::string& section, const std::string& key) const {
    return config_.contains(section) && config_.at(section).is_object() &&
           config_.at(section).contains(key);
}

nlohmann::json ConfigStore::section(const std::string& name) const {
    if (config_.contains(name) && config_.at(name).is_object()) {
        return config_.at(name);
    }
    return nlohmann::json::object();
}

Result<void> ConfigStore::validate_names(const std::string& section,
                                         const std::string& key) const {
    static const std::regex name_pattern(R"(^[a-zA-Z0-9_]{1,64}$)");
    if (!std::regex_match(section, name_pattern)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Invalid section name: " + section,
                                "ConfigStore");
    }
    if (!std::regex_match(key, name_pattern)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Invalid key name: " + key,
                                "ConfigStore");
    }
    return Result<void>();
}

}  // namespace data_ngin
