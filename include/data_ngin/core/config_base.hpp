// include/data_ngin/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "data_ngin/core/error.hpp"

namespace data_ngin {

/**
 * @brief JSON-serializable settings object
 *
 * Subclasses supply to_json/from_json; file persistence is shared.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write to_json() to a file, creating missing parent directories
     * @return FILE_IO_ERROR when the file cannot be written
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Read a file and apply it with from_json()
     * @return FILE_NOT_FOUND, JSON_PARSE_ERROR, CONVERSION_ERROR for a value of
     * the wrong JSON type, or the code of a DataError raised by from_json()
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Apply a JSON document
     * Keys absent from the JSON leave the current value untouched.
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace data_ngin
