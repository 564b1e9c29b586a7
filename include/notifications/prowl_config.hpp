#ifndef PROWL_CONFIG_HPP
#define PROWL_CONFIG_HPP

#include "prowl_error.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace prowl {

class Logger;
class HttpTransport;

constexpr size_t KEY_LENGTH = 40;
constexpr size_t MAX_APPLICATION_LENGTH = 256;

extern const char* const DEFAULT_BASE_URL;
extern const char* const DEFAULT_TO_PROWL_LABEL;

struct ProwlConfig {
    // Device api keys. Only used to seed the client; the client works on a
    // set and copies it back here when config() is called.
    std::vector<std::string> api_keys;

    // Required by retrieveToken() and retrieveApiKey(). Optional for add,
    // where it may unlock a higher api call limit.
    std::string provider_key;

    // Issued by retrieveToken(), consumed by retrieveApiKey(). Only needs to
    // be set by hand when a persisted config resumes the pairing.
    std::string token;

    // Shown above every message in the prowl app.
    std::string application;

    // Appended to log lines written by log()/logSync().
    std::optional<std::string> to_prowl_label;

    std::string base_url;

    // Runtime only, never persisted.
    std::shared_ptr<Logger> logger;
    std::shared_ptr<HttpTransport> transport;
    std::chrono::milliseconds log_timeout{std::chrono::seconds(30)};
};

bool validateConfig(const ProwlConfig& config, ProwlError* out_error);

std::string configToJson(const ProwlConfig& config);
bool configFromJson(const std::string& json, ProwlConfig* out_config, ProwlError* out_error);

bool loadConfigFile(const std::string& path, ProwlConfig* out_config, ProwlError* out_error);
bool saveConfigFile(const std::string& path, const ProwlConfig& config, ProwlError* out_error);

} // namespace prowl

#endif // PROWL_CONFIG_HPP
