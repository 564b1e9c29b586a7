#include <gtest/gtest.h>

#include "mock_transport.hpp"
#include "notifications/prowl_config.hpp"

#include <cstdio>
#include <fstream>

using namespace prowl;
using namespace prowl_test;

TEST(ProwlConfigTest, ValidateChecksLengths) {
    ProwlConfig config;
    ProwlError error;
    EXPECT_TRUE(validateConfig(config, &error));

    config.provider_key = std::string(39, 'p');
    EXPECT_FALSE(validateConfig(config, &error));
    EXPECT_EQ(error.kind, ProwlErrorKind::VALIDATION);
    config.provider_key = PROVIDER_KEY;

    config.token = std::string(41, 't');
    EXPECT_FALSE(validateConfig(config, &error));
    config.token = TOKEN;

    config.application = std::string(257, 'a');
    EXPECT_FALSE(validateConfig(config, &error));
    config.application = "ok";

    config.api_keys = {API_KEY, ""};
    EXPECT_FALSE(validateConfig(config, &error));
    config.api_keys = {API_KEY, API_KEY_2};
    EXPECT_TRUE(validateConfig(config, &error));
}

TEST(ProwlConfigTest, JsonRoundTrip) {
    ProwlConfig config;
    config.api_keys = {API_KEY, API_KEY_2};
    config.provider_key = PROVIDER_KEY;
    config.token = TOKEN;
    config.application = "prowl \"example\"";
    config.to_prowl_label = "--> Prowl";
    config.base_url = BASE_URL;

    ProwlConfig restored;
    ProwlError error;
    ASSERT_TRUE(configFromJson(configToJson(config), &restored, &error)) << error.message;
    EXPECT_EQ(restored.api_keys, config.api_keys);
    EXPECT_EQ(restored.provider_key, PROVIDER_KEY);
    EXPECT_EQ(restored.token, TOKEN);
    EXPECT_EQ(restored.application, "prowl \"example\"");
    ASSERT_TRUE(restored.to_prowl_label.has_value());
    EXPECT_EQ(*restored.to_prowl_label, "--> Prowl");
    EXPECT_EQ(restored.base_url, BASE_URL);
    EXPECT_FALSE(restored.logger);
    EXPECT_FALSE(restored.transport);
}

TEST(ProwlConfigTest, JsonWithoutKeysOrLabel) {
    ProwlConfig config;
    config.application = "empty";

    ProwlConfig restored;
    ASSERT_TRUE(configFromJson(configToJson(config), &restored, nullptr));
    EXPECT_TRUE(restored.api_keys.empty());
    EXPECT_FALSE(restored.to_prowl_label.has_value());
    EXPECT_EQ(restored.application, "empty");
    EXPECT_TRUE(restored.base_url.empty());
}

TEST(ProwlConfigTest, HandWrittenJson) {
    const std::string json = R"({
        "api_keys": [")" + API_KEY + R"("],
        "application": "cron"
    })";
    ProwlConfig restored;
    ProwlError error;
    ASSERT_TRUE(configFromJson(json, &restored, &error)) << error.message;
    ASSERT_EQ(restored.api_keys.size(), 1u);
    EXPECT_EQ(restored.api_keys[0], API_KEY);
    EXPECT_EQ(restored.application, "cron");
    EXPECT_TRUE(restored.provider_key.empty());
}

TEST(ProwlConfigTest, RejectsBadJson) {
    ProwlConfig restored;
    ProwlError error;
    EXPECT_FALSE(configFromJson("{\"api_keys\": [", &restored, &error));
    EXPECT_EQ(error.kind, ProwlErrorKind::DECODE);

    error.clear();
    EXPECT_FALSE(configFromJson("{\"api_keys\": \"" + API_KEY + "\"}", &restored, &error));
    EXPECT_EQ(error.kind, ProwlErrorKind::DECODE);
}

TEST(ProwlConfigTest, SaveAndLoadFile) {
    const std::string path = ::testing::TempDir() + "prowl_config_test.json";

    ProwlConfig config;
    config.api_keys = {API_KEY};
    config.provider_key = PROVIDER_KEY;
    config.application = "file";

    ProwlError error;
    ASSERT_TRUE(saveConfigFile(path, config, &error)) << error.message;

    ProwlConfig loaded;
    ASSERT_TRUE(loadConfigFile(path, &loaded, &error)) << error.message;
    EXPECT_EQ(loaded.api_keys, config.api_keys);
    EXPECT_EQ(loaded.provider_key, PROVIDER_KEY);
    EXPECT_EQ(loaded.application, "file");
    std::remove(path.c_str());

    EXPECT_FALSE(loadConfigFile(path, &loaded, &error));
    EXPECT_EQ(error.kind, ProwlErrorKind::VALIDATION);
}
