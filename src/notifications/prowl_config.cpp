#include "../../include/notifications/prowl_config.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fstream>
#include <sstream>

namespace prowl {

namespace pt = boost::property_tree;

const char* const DEFAULT_BASE_URL = "https://api.prowlapp.com/publicapi/";
const char* const DEFAULT_TO_PROWL_LABEL = "(copied to prowl)";

bool validateConfig(const ProwlConfig& config, ProwlError* out_error) {
    if (!config.provider_key.empty() && config.provider_key.size() != KEY_LENGTH) {
        return fail(out_error, ProwlErrorKind::VALIDATION,
                    "provider key must either be 40 chars long or undefined");
    }
    if (!config.token.empty() && config.token.size() != KEY_LENGTH) {
        return fail(out_error, ProwlErrorKind::VALIDATION,
                    "token must either be 40 chars long or undefined");
    }
    if (config.application.size() > MAX_APPLICATION_LENGTH) {
        return fail(out_error, ProwlErrorKind::VALIDATION,
                    "application must not exceed 256 chars in length");
    }
    for (const auto& key : config.api_keys) {
        if (key.size() != KEY_LENGTH) {
            return fail(out_error, ProwlErrorKind::VALIDATION, "api key must be 40 chars long");
        }
    }
    return true;
}

std::string configToJson(const ProwlConfig& config) {
    pt::ptree root;
    pt::ptree keys;
    for (const auto& key : config.api_keys) {
        pt::ptree node;
        node.put_value(key);
        keys.push_back(std::make_pair("", node));
    }
    root.add_child("api_keys", keys);
    root.put("provider_key", config.provider_key);
    root.put("token", config.token);
    root.put("application", config.application);
    if (config.to_prowl_label) {
        root.put("to_prowl_label", *config.to_prowl_label);
    }
    if (!config.base_url.empty()) {
        root.put("base_url", config.base_url);
    }

    std::ostringstream ss;
    pt::write_json(ss, root, true);
    return ss.str();
}

bool configFromJson(const std::string& json, ProwlConfig* out_config, ProwlError* out_error) {
    pt::ptree root;
    try {
        std::istringstream ss(json);
        pt::read_json(ss, root);
    } catch (const pt::json_parser_error& e) {
        return fail(out_error, ProwlErrorKind::DECODE, std::string("invalid config json: ") + e.what());
    }

    ProwlConfig config;
    auto keysOpt = root.get_child_optional("api_keys");
    if (keysOpt) {
        if (keysOpt->empty() && !keysOpt->data().empty()) {
            return fail(out_error, ProwlErrorKind::DECODE, "api_keys must be an array");
        }
        for (const auto& item : *keysOpt) {
            config.api_keys.push_back(item.second.get_value<std::string>());
        }
    }
    config.provider_key = root.get<std::string>("provider_key", "");
    config.token = root.get<std::string>("token", "");
    config.application = root.get<std::string>("application", "");
    auto labelOpt = root.get_optional<std::string>("to_prowl_label");
    if (labelOpt) {
        config.to_prowl_label = *labelOpt;
    }
    config.base_url = root.get<std::string>("base_url", "");

    if (out_config) *out_config = std::move(config);
    return true;
}

bool loadConfigFile(const std::string& path, ProwlConfig* out_config, ProwlError* out_error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return fail(out_error, ProwlErrorKind::VALIDATION, "config file not found: " + path);
    }
    std::ostringstream buf;
    buf << file.rdbuf();
    return configFromJson(buf.str(), out_config, out_error);
}

bool saveConfigFile(const std::string& path, const ProwlConfig& config, ProwlError* out_error) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return fail(out_error, ProwlErrorKind::VALIDATION, "can't write config file: " + path);
    }
    file << configToJson(config);
    file.flush();
    if (!file) {
        return fail(out_error, ProwlErrorKind::VALIDATION, "can't write config file: " + path);
    }
    return true;
}

} // namespace prowl
