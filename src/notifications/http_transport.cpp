#include "../../include/notifications/http_transport.hpp"
#include "../../include/utils/logger.hpp"

#include <curl/curl.h>

#include <cctype>
#include <iomanip>
#include <sstream>
#include <utility>

namespace prowl {

namespace {

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    auto* out = static_cast<std::string*>(userp);
    out->append(static_cast<char*>(contents), total);
    return total;
}

} // namespace

CurlTransport::CurlTransport(long timeout_seconds, std::shared_ptr<Logger> logger)
    : timeout_seconds_(timeout_seconds), logger_(std::move(logger)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

bool CurlTransport::get(const std::string& url,
                        HttpResponse* out_response,
                        std::string* out_error) {
    HttpResponse response;
    CURL* curl = curl_easy_init();
    if (!curl) {
        if (out_error) *out_error = "curl_easy_init failed";
        return false;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        if (out_error) *out_error = curl_easy_strerror(res);
        if (logger_) logger_->debug("HTTP GET failed: " + std::string(curl_easy_strerror(res)));
        return false;
    }
    if (out_response) *out_response = std::move(response);
    return true;
}

bool CurlTransport::postForm(const std::string& url,
                             const std::string& form_body,
                             HttpResponse* out_response,
                             std::string* out_error) {
    HttpResponse response;
    CURL* curl = curl_easy_init();
    if (!curl) {
        if (out_error) *out_error = "curl_easy_init failed";
        return false;
    }

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/x-www-form-urlencoded");
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, form_body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(form_body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        if (out_error) *out_error = curl_easy_strerror(res);
        if (logger_) logger_->debug("HTTP POST failed: " + std::string(curl_easy_strerror(res)));
        return false;
    }
    if (out_response) *out_response = std::move(response);
    return true;
}

std::string urlEncode(const std::string& input) {
    std::ostringstream encoded;
    encoded << std::uppercase << std::hex;
    for (unsigned char c : input) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return encoded.str();
}

void appendFormField(std::string& body, const std::string& key, const std::string& value) {
    if (!body.empty()) {
        body += "&";
    }
    body += urlEncode(key);
    body += "=";
    body += urlEncode(value);
}

} // namespace prowl
