#include "notifications/prowl_client.hpp"
#include "notifications/prowl_config.hpp"
#include "utils/logger.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [args]\n"
              << "  add <priority> <event> <description> [url]\n"
              << "  log <priority> <event> <description>\n"
              << "  verify <apikey>\n"
              << "  token\n"
              << "  apikey\n"
              << "Config is read from $PROWL_CONFIG (default prowl.json).\n";
}

bool parsePriority(const std::string& value, int* out) {
    try {
        size_t used = 0;
        int prio = std::stoi(value, &used);
        if (used != value.size()) return false;
        *out = prio;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 2;
    }

    const char* env_config = std::getenv("PROWL_CONFIG");
    std::string config_path = env_config ? env_config : "prowl.json";

    const char* env_log_file = std::getenv("PROWL_LOG_FILE");
    if (env_log_file) {
        prowl::Logger::getInstance().setLogFile(env_log_file);
    }

    prowl::ProwlError error;
    prowl::ProwlConfig config;
    if (!prowl::loadConfigFile(config_path, &config, &error)) {
        prowl::Logger::getInstance().error(error.message);
        return 1;
    }
    config.logger = std::make_shared<prowl::Logger>();
    if (env_log_file) {
        config.logger->setLogFile(env_log_file);
    }

    auto client = prowl::ProwlClient::create(config, &error);
    if (!client) {
        prowl::Logger::getInstance().error("invalid config " + config_path + ": " + error.message);
        return 1;
    }

    const std::string command = argv[1];

    if (command == "add" || command == "log") {
        if (argc < 5 || (command == "log" && argc != 5) || argc > 6) {
            printUsage(argv[0]);
            return 2;
        }
        int prio = 0;
        if (!parsePriority(argv[2], &prio)) {
            std::cerr << "priority must be an integer in -2..2" << std::endl;
            return 2;
        }
        if (command == "log") {
            client->logSync(prio, argv[3], argv[4]);
            return 0;
        }
        int remaining = 0;
        std::string url = argc == 6 ? argv[5] : "";
        if (!client->addWithUrl(prio, argv[3], argv[4], url, &remaining, &error)) {
            prowl::Logger::getInstance().error(error.message);
            return 1;
        }
        std::cout << remaining << " api calls left" << std::endl;
        return 0;
    }

    if (command == "verify") {
        if (argc != 3) {
            printUsage(argv[0]);
            return 2;
        }
        int remaining = 0;
        if (!client->verify(argv[2], &remaining, &error)) {
            prowl::Logger::getInstance().error(error.message);
            return 1;
        }
        std::cout << "api key is valid, " << remaining << " api calls left" << std::endl;
        return 0;
    }

    if (command == "token") {
        std::string approve_url;
        if (!client->retrieveToken(&approve_url, &error)) {
            prowl::Logger::getInstance().error(error.message);
            return 1;
        }
        if (!prowl::saveConfigFile(config_path, client->config(), &error)) {
            prowl::Logger::getInstance().error(error.message);
            return 1;
        }
        std::cout << "Please approve the api key request at: " << approve_url << std::endl;
        return 0;
    }

    if (command == "apikey") {
        std::string api_key;
        if (!client->retrieveApiKey(&api_key, &error)) {
            if (error.kind == prowl::ProwlErrorKind::NOT_APPROVED) {
                std::cerr << "request not approved yet, try again later" << std::endl;
            } else {
                prowl::Logger::getInstance().error(error.message);
            }
            return 1;
        }
        if (!prowl::saveConfigFile(config_path, client->config(), &error)) {
            prowl::Logger::getInstance().error(error.message);
            return 1;
        }
        std::cout << api_key << std::endl;
        return 0;
    }

    printUsage(argv[0]);
    return 2;
}
