#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "data_ngin/core/config_store.hpp"

namespace fs = std::filesystem;
using namespace data_ngin;

class ConfigStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("DATA_NGIN_CONFIG_PATH");

        std::ofstream test_config(config_path);
        test_config << R"({
            "download": {
                "data_folder": "/tmp/lean-data",
                "max_concurrency": 4,
                "debug_mode": true
            },
            "polygon": {
                "api_key": "test_api_key",
                "max_retries": 2
            },
            "logging": {
                "min_level": "DEBUG"
            },
            "empty_section": {}
        })";
        test_config.close();
    }

    void TearDown() override {
        unsetenv("DATA_NGIN_CONFIG_PATH");
        if (fs::exists(config_path)) {
            fs::remove(config_path);
        }
        if (fs::exists(override_path)) {
            fs::remove(override_path);
        }
    }

    const std::string config_path = "test_data_ngin_config.json";
    const std::string override_path = "test_data_ngin_override.json";
};

TEST_F(ConfigStoreTest, LoadsConfigurationSuccessfully) {
    ConfigStore config(config_path);
    ASSERT_TRUE(config.load_config().is_ok());

    auto folder = config.get<std::string>("download", "data_folder");
    ASSERT_TRUE(folder.is_ok());
    EXPECT_EQ(folder.value(), "/tmp/lean-data");

    auto concurrency = config.get<int>("download", "max_concurrency");
    ASSERT_TRUE(concurrency.is_ok());
    EXPECT_EQ(concurrency.value(), 4);

    auto debug = config.get<bool>("download", "debug_mode");
    ASSERT_TRUE(debug.is_ok());
    EXPECT_TRUE(debug.value());
}

TEST_F(ConfigStoreTest, MissingKeysAndSections) {
    ConfigStore config(config_path);
    ASSERT_TRUE(config.load_config().is_ok());

    auto missing_key = config.get<std::string>("polygon", "base_url");
    ASSERT_TRUE(missing_key.is_error());
    EXPECT_EQ(missing_key.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto missing_section = config.get<std::string>("nonexistent", "key");
    EXPECT_TRUE(missing_section.is_error());

    EXPECT_FALSE(config.has("empty_section", "anything"));
    EXPECT_TRUE(config.section("nonexistent").is_object());
    EXPECT_TRUE(config.section("nonexistent").empty());
}

TEST_F(ConfigStoreTest, TypeConversionFailure) {
    ConfigStore config(config_path);
    ASSERT_TRUE(config.load_config().is_ok());

    auto wrong_type = config.get<int>("polygon", "api_key");
    ASSERT_TRUE(wrong_type.is_error());
    EXPECT_EQ(wrong_type.error()->code(), ErrorCode::CONVERSION_ERROR);
}

TEST_F(ConfigStoreTest, DefaultsApplyWhenAbsent) {
    ConfigStore config(config_path);
    ASSERT_TRUE(config.load_config().is_ok());

    EXPECT_EQ(config.get_with_default<std::string>("download", "results_destination_folder", ""),
              "");
    EXPECT_EQ(config.get_with_default<int>("polygon", "max_retries", 3), 2);
    EXPECT_EQ(config.get_with_default<int>("polygon", "page_limit", 50000), 50000);
}

TEST_F(ConfigStoreTest, SectionReturnsWholeObject) {
    ConfigStore config(config_path);
    ASSERT_TRUE(config.load_config().is_ok());

    nlohmann::json polygon = config.section("polygon");
    EXPECT_EQ(polygon.at("api_key").get<std::string>(), "test_api_key");
    EXPECT_EQ(polygon.size(), 2u);
}

TEST_F(ConfigStoreTest, InvalidNamesRejected) {
    ConfigStore config(config_path);
    ASSERT_TRUE(config.load_config().is_ok());

    auto bad_section = config.get<std::string>("poly gon", "api_key");
    ASSERT_TRUE(bad_section.is_error());
    EXPECT_EQ(bad_section.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto bad_key = config.get<std::string>("polygon", "api-key");
    EXPECT_TRUE(bad_key.is_error());
}

TEST_F(ConfigStoreTest, MissingFileReported) {
    ConfigStore config("does_not_exist.json");
    auto result = config.load_config();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigStoreTest, MalformedFileReported) {
    {
        std::ofstream bad(config_path);
        bad << "{ not json";
    }
    ConfigStore config(config_path);
    auto result = config.load_config();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigStoreTest, EnvironmentOverridesPath) {
    {
        std::ofstream override_file(override_path);
        override_file << R"({"download": {"data_folder": "/override"}})";
    }
    setenv("DATA_NGIN_CONFIG_PATH", override_path.c_str(), 1);

    ConfigStore config(config_path);
    EXPECT_EQ(config.path(), override_path);
    ASSERT_TRUE(config.load_config().is_ok());
    EXPECT_EQ(config.get<std::string>("download", "data_folder").value(), "/override");
}

TEST_F(ConfigStoreTest, EnvironmentOverrideNeedsJsonExtension) {
    setenv("DATA_NGIN_CONFIG_PATH", "/etc/passwd", 1);

    ConfigStore config(config_path);
    EXPECT_EQ(config.path(), config_path);
}

TEST_F(ConfigStoreTest, LoadJsonReplacesContents) {
    ConfigStore config(config_path);
    config.load_json(nlohmann::json{{"polygon", {{"api_key", "inline"}}}});

    EXPECT_EQ(config.get<std::string>("polygon", "api_key").value(), "inline");
    EXPECT_FALSE(config.has("download", "data_folder"));
}
