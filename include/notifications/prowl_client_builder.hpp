#ifndef PROWL_CLIENT_BUILDER_HPP
#define PROWL_CLIENT_BUILDER_HPP

#include "prowl_client.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace prowl {

// Chained alternative to filling a ProwlConfig by hand. build() applies the
// same validation as ProwlClient::create().
class ProwlClientBuilder {
public:
    ProwlClientBuilder& addApiKey(const std::string& api_key);
    ProwlClientBuilder& setProviderKey(const std::string& provider_key);
    ProwlClientBuilder& setToken(const std::string& token);
    ProwlClientBuilder& setApplication(const std::string& application);
    ProwlClientBuilder& setLogger(std::shared_ptr<Logger> logger);
    ProwlClientBuilder& setToProwlLabel(const std::string& label);
    ProwlClientBuilder& setBaseUrl(const std::string& base_url);
    ProwlClientBuilder& setTransport(std::shared_ptr<HttpTransport> transport);
    ProwlClientBuilder& setLogTimeout(std::chrono::milliseconds timeout);

    std::shared_ptr<ProwlClient> build(ProwlError* out_error = nullptr) const;

private:
    ProwlConfig config_;
};

} // namespace prowl

#endif // PROWL_CLIENT_BUILDER_HPP
