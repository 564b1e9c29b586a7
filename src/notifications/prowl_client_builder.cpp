#include "../../include/notifications/prowl_client_builder.hpp"

#include <utility>

namespace prowl {

ProwlClientBuilder& ProwlClientBuilder::addApiKey(const std::string& api_key) {
    config_.api_keys.push_back(api_key);
    return *this;
}

ProwlClientBuilder& ProwlClientBuilder::setProviderKey(const std::string& provider_key) {
    config_.provider_key = provider_key;
    return *this;
}

ProwlClientBuilder& ProwlClientBuilder::setToken(const std::string& token) {
    config_.token = token;
    return *this;
}

ProwlClientBuilder& ProwlClientBuilder::setApplication(const std::string& application) {
    config_.application = application;
    return *this;
}

ProwlClientBuilder& ProwlClientBuilder::setLogger(std::shared_ptr<Logger> logger) {
    config_.logger = std::move(logger);
    return *this;
}

ProwlClientBuilder& ProwlClientBuilder::setToProwlLabel(const std::string& label) {
    config_.to_prowl_label = label;
    return *this;
}

ProwlClientBuilder& ProwlClientBuilder::setBaseUrl(const std::string& base_url) {
    config_.base_url = base_url;
    return *this;
}

ProwlClientBuilder& ProwlClientBuilder::setTransport(std::shared_ptr<HttpTransport> transport) {
    config_.transport = std::move(transport);
    return *this;
}

ProwlClientBuilder& ProwlClientBuilder::setLogTimeout(std::chrono::milliseconds timeout) {
    config_.log_timeout = timeout;
    return *this;
}

std::shared_ptr<ProwlClient> ProwlClientBuilder::build(ProwlError* out_error) const {
    return ProwlClient::create(config_, out_error);
}

} // namespace prowl
