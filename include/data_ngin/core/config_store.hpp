// include/data_ngin/core/config_store.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "data_ngin/core/error.hpp"

namespace data_ngin {

/**
 * @brief Sectioned JSON configuration file
 *
 * Layout is { "<section>": { "<key>": value, ... }, ... }. The path given to
 * the constructor is overridden by the DATA_NGIN_CONFIG_PATH environment
 * variable when that names a .json file.
 */
class ConfigStore {
public:
    explicit ConfigStore(const std::string& path = "config.json");

    /**
     * @brief Load or reload the file
     * @return FILE_NOT_FOUND, FILE_IO_ERROR or JSON_PARSE_ERROR on failure
     */
    Result<void> load_config();

    /**
     * @brief Replace the contents with an in-memory document
     */
    void load_json(const nlohmann::json& document);

    const std::string& path() const {
        return config_path_;
    }

    /**
     * @brief Get a typed value
     * @return INVALID_ARGUMENT when absent, CONVERSION_ERROR when of the wrong type
     */
    template <typename T>
    Result<T> get(const std::string& section, const std::string& key) const;

    template <typename T>
    T get_with_default(const std::string& section, const std::string& key,
                       const T& default_value) const;

    bool has(const std::string& section, const std::string& key) const;

    /**
     * @brief Whole section as JSON, an empty object when absent
     */
    nlohmann::json section(const std::string& name) const;

private:
    Result<void> validate_names(const std::string& section, const std::string& key) const;

    nlohmann::json config_;
    std::string config_path_;
};

template <typename T>
Result<T> ConfigStore::get(const std::string& section, const std::string& key) const {
    auto name_validation = validate_names(section, key);
    if (name_validation.is_error()) {
        return forward_error<T>(name_validation, "ConfigStore");
    }

    if (!has(section, key)) {
        return make_error<T>(ErrorCode::INVALID_ARGUMENT,
                             "Configuration not found: " + section + "." + key, "ConfigStore");
    }

    try {
        return Result<T>(config_.at(section).at(key).get<T>());
    } catch (const std::exception& e) {
        return make_error<T>(ErrorCode::CONVERSION_ERROR,
                             "Failed to convert " + section + "." + key + ": " + e.what(),
                             "ConfigStore");
    }
}

template <typename T>
T ConfigStore::get_with_default(const std::string& section, const std::string& key,
                                const T& default_value) const {
    auto result = get<T>(section, key);
    return result.is_error() ? default_value : result.value();
}

}  // namespace data_ngin
