#include <gtest/gtest.h>

#include "log_capture.hpp"
#include "mock_transport.hpp"
#include "notifications/prowl_client_builder.hpp"

#include <ctime>

using namespace prowl;
using namespace prowl_test;

TEST(ProwlClientBuilderTest, BuildsConfiguredClient) {
    auto transport = std::make_shared<MockTransport>();
    auto capture = std::make_shared<LogCapture>();
    transport->respond("add", 200, successXml(77, static_cast<int64_t>(std::time(nullptr)) + 60));

    ProwlError error;
    auto client = ProwlClientBuilder()
                      .addApiKey(API_KEY)
                      .setProviderKey(PROVIDER_KEY)
                      .setToken(TOKEN)
                      .setApplication("builder")
                      .setToProwlLabel("[prowl]")
                      .setLogger(makeCapturingLogger(capture))
                      .setBaseUrl("http://prowl.test/publicapi")
                      .setTransport(transport)
                      .setLogTimeout(std::chrono::seconds(2))
                      .build(&error);
    ASSERT_TRUE(client) << error.message;

    ProwlConfig config = client->config();
    EXPECT_EQ(config.provider_key, PROVIDER_KEY);
    EXPECT_EQ(config.token, TOKEN);
    EXPECT_EQ(config.application, "builder");
    EXPECT_EQ(config.base_url, BASE_URL);
    EXPECT_EQ(config.log_timeout, std::chrono::milliseconds(2000));
    EXPECT_TRUE(client->hasApiKey(API_KEY));

    client->log(priority::NORMAL, "Event", "Message");
    EXPECT_TRUE(capture->contains("Event: Message [prowl]"));
    EXPECT_EQ(client->remaining(), 77);
}

TEST(ProwlClientBuilderTest, BuildValidates) {
    ProwlError error;
    auto client = ProwlClientBuilder().addApiKey("too short").build(&error);
    EXPECT_FALSE(client);
    EXPECT_EQ(error.kind, ProwlErrorKind::VALIDATION);

    client = ProwlClientBuilder().setProviderKey("12345").build(&error);
    EXPECT_FALSE(client);
}
