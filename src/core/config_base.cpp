// src/core/config_base.cpp

#include "data_ngin/core/config_base.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace data_ngin {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    const std::filesystem::path target(filepath);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to create directory " +
                                        target.parent_path().string() + ": " + ec.message(),
                                    "ConfigBase");
        }
    }

    std::ofstream file(target);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Cannot write " + filepath,
                                "ConfigBase");
    }
    try {
        file << std::setw(4) << to_json() << std::endl;
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::CONVERSION_ERROR,
                                "Cannot serialize " + filepath + ": " + e.what(), "ConfigBase");
    }
    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Write to " + filepath + " failed",
                                "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Cannot read " + filepath,
                                "ConfigBase");
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Invalid JSON in " + filepath + ": " + e.what(), "ConfigBase");
    }

    try {
        from_json(j);
    } catch (const DataError& e) {
        // Field validation failures keep their own code, e.g. a malformed date
        return make_error<void>(e.code(), filepath + ": " + e.what(), "ConfigBase");
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::CONVERSION_ERROR,
                                "Unexpected value in " + filepath + ": " + e.what(),
                                "ConfigBase");
    }
    return Result<void>();
}

}  // namespace data_ngin
