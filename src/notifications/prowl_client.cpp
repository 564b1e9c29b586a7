#include "../../include/notifications/prowl_client.hpp"
#include "../../include/utils/logger.hpp"

#include <ctime>
#include <future>
#include <iomanip>
#include <sstream>
#include <thread>

namespace prowl {

namespace {

const std::chrono::milliseconds WAIT_SYNC(-1);

std::string trim(const std::string& value) {
    const char* ws = " \t\n\r\f\v";
    size_t start = value.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(ws);
    return value.substr(start, end - start + 1);
}

std::string formatTime(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

// Shortens s to max chars, the last three being "...".
std::string shorten(const std::string& s, size_t max) {
    if (s.size() <= max) return s;
    return trim(s.substr(0, max - 3)) + "...";
}

} // namespace

std::shared_ptr<ProwlClient> ProwlClient::create(const ProwlConfig& config, ProwlError* out_error) {
    if (!validateConfig(config, out_error)) {
        return nullptr;
    }
    if (out_error) out_error->clear();
    return std::shared_ptr<ProwlClient>(new ProwlClient(config));
}

ProwlClient::ProwlClient(const ProwlConfig& config)
    : config_(config),
      api_keys_(config.api_keys.begin(), config.api_keys.end()),
      reset_(std::chrono::system_clock::now()) {
    api_keys_dirty_ = api_keys_.size() != config_.api_keys.size();

    if (!config_.logger) {
        config_.logger = std::make_shared<Logger>();
    }
    if (!config_.transport) {
        config_.transport = std::make_shared<CurlTransport>(30, config_.logger);
    }
    if (!config_.to_prowl_label) {
        config_.to_prowl_label = std::string(DEFAULT_TO_PROWL_LABEL);
    }
    if (config_.base_url.empty()) {
        config_.base_url = DEFAULT_BASE_URL;
    } else if (config_.base_url.back() != '/') {
        config_.base_url += '/';
    }

    logger_ = config_.logger;
    transport_ = config_.transport;
}

bool ProwlClient::addApiKey(const std::string& api_key, ProwlError* out_error) {
    if (api_key.size() != KEY_LENGTH) {
        return fail(out_error, ProwlErrorKind::VALIDATION, "api key must be 40 chars long");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (api_keys_.insert(api_key).second) {
        api_keys_dirty_ = true;
    }
    return true;
}

bool ProwlClient::removeApiKey(const std::string& api_key, ProwlError* out_error) {
    if (api_key.size() != KEY_LENGTH) {
        return fail(out_error, ProwlErrorKind::VALIDATION, "api key must be 40 chars long");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (api_keys_.erase(api_key) > 0) {
        api_keys_dirty_ = true;
    }
    return true;
}

bool ProwlClient::hasApiKey(const std::string& api_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return api_keys_.count(api_key) > 0;
}

size_t ProwlClient::apiKeyCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return api_keys_.size();
}

ProwlConfig ProwlClient::config() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (api_keys_dirty_) {
        config_.api_keys.assign(api_keys_.begin(), api_keys_.end());
        api_keys_dirty_ = false;
    }
    return config_;
}

bool ProwlClient::add(int priority,
                      const std::string& event,
                      const std::string& description,
                      int* out_remaining,
                      ProwlError* out_error) {
    return addWithUrl(priority, event, description, "", out_remaining, out_error);
}

bool ProwlClient::addWithUrl(int priority,
                             const std::string& event,
                             const std::string& description,
                             const std::string& url,
                             int* out_remaining,
                             ProwlError* out_error) {
    ProwlNotification notification;
    notification.priority = priority;
    notification.event = event;
    notification.description = description;
    notification.url = url;
    return send(notification, out_remaining, out_error);
}

bool ProwlClient::send(const ProwlNotification& notification, int* out_remaining, ProwlError* out_error) {
    std::string api_key_arg;
    std::string provider_key;
    std::string application;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (out_remaining) *out_remaining = remaining_;

        if (unauthorized_) {
            return fail(out_error, ProwlErrorKind::UNAUTHORIZED, "the api key is known to be invalid");
        }
        if (api_keys_.empty()) {
            return fail(out_error, ProwlErrorKind::VALIDATION, "a valid api key is required for add operation");
        }
        if (notification.priority < priority::VERY_LOW || notification.priority > priority::EMERGENCY) {
            return fail(out_error, ProwlErrorKind::VALIDATION, "priority argument must be in the range -2..2");
        }
        if (notification.event.size() > MAX_EVENT_LENGTH) {
            return fail(out_error, ProwlErrorKind::VALIDATION, "event argument must not exceed 1024 chars");
        }
        if (notification.description.size() > MAX_DESCRIPTION_LENGTH) {
            return fail(out_error, ProwlErrorKind::VALIDATION, "description argument must not exceed 10000 chars");
        }
        if (notification.url.size() > MAX_URL_LENGTH) {
            return fail(out_error, ProwlErrorKind::VALIDATION, "url argument must not exceed 256 chars");
        }
        if (remaining_ <= 0 && std::chrono::system_clock::now() < reset_) {
            return fail(out_error, ProwlErrorKind::RATE_LIMITED,
                        "api requests spent; come back after " + formatTime(reset_));
        }

        api_key_arg = makeApiKeyRequestArgument();
        provider_key = config_.provider_key;
        application = config_.application;
    }

    std::string event = trim(notification.event);
    std::string description = trim(notification.description);
    std::string url = trim(notification.url);

    if (!url.empty() && notification.embed_url) {
        if (description.size() + url.size() + 4 > MAX_DESCRIPTION_LENGTH) {
            description = trim(description.substr(0, MAX_DESCRIPTION_LENGTH - url.size() - 4)) + "...";
        }
        description += " " + url;
    }

    std::string form;
    appendFormField(form, "apikey", api_key_arg);
    appendFormField(form, "providerkey", provider_key);
    appendFormField(form, "priority", std::to_string(notification.priority));
    appendFormField(form, "application", application);
    appendFormField(form, "event", event);
    appendFormField(form, "description", description);
    appendFormField(form, "url", url);

    HttpResponse http;
    std::string transport_error;
    bool ok = transport_->postForm(endpoint("add"), form, &http, &transport_error);

    ProwlError error;
    if (!handleResponse(ok, http, transport_error, RequestOrigin::ADD, nullptr, &error)) {
        if (out_remaining) *out_remaining = remaining();
        return fail(out_error, error.kind, "add request to prowl server failed: " + error.message, error.code);
    }

    if (out_remaining) *out_remaining = remaining();
    if (out_error) out_error->clear();
    return true;
}

bool ProwlClient::verify(const std::string& api_key, int* out_remaining, ProwlError* out_error) {
    if (out_remaining) *out_remaining = remaining();
    if (api_key.size() != KEY_LENGTH) {
        return fail(out_error, ProwlErrorKind::VALIDATION, "apiKey argument must be exactly 40 chars long");
    }

    std::string query;
    appendFormField(query, "apikey", api_key);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (config_.provider_key.size() == KEY_LENGTH) {
            appendFormField(query, "providerkey", config_.provider_key);
        }
    }

    HttpResponse http;
    std::string transport_error;
    bool ok = transport_->get(endpoint("verify") + "?" + query, &http, &transport_error);

    ProwlError error;
    bool handled = handleResponse(ok, http, transport_error, RequestOrigin::OTHER, nullptr, &error);
    if (out_remaining) *out_remaining = remaining();
    if (!handled) {
        return fail(out_error, error.kind, "verify request to prowl server failed: " + error.message, error.code);
    }
    if (out_error) out_error->clear();
    return true;
}

bool ProwlClient::retrieveToken(std::string* out_approve_url, ProwlError* out_error) {
    std::string query;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (config_.provider_key.size() != KEY_LENGTH) {
            return fail(out_error, ProwlErrorKind::VALIDATION,
                        "provider key is required for retrieve token operation");
        }
        appendFormField(query, "providerkey", config_.provider_key);
    }

    HttpResponse http;
    std::string transport_error;
    bool ok = transport_->get(endpoint("retrieve/token") + "?" + query, &http, &transport_error);

    ProwlError error;
    ProwlResponse response;
    if (!handleResponse(ok, http, transport_error, RequestOrigin::OTHER, &response, &error)) {
        return fail(out_error, error.kind,
                    "retrieve token request to prowl server failed: " + error.message, error.code);
    }
    if (!response.has_retrieve || response.retrieve_token.size() != KEY_LENGTH) {
        return fail(out_error, ProwlErrorKind::DECODE,
                    "retrieve token request to prowl server failed: response carries no valid token");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.token = response.retrieve_token;
    }
    if (out_approve_url) *out_approve_url = response.retrieve_url;
    if (out_error) out_error->clear();
    return true;
}

bool ProwlClient::retrieveApiKey(std::string* out_api_key, ProwlError* out_error) {
    std::string query;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (config_.token.size() != KEY_LENGTH) {
            return fail(out_error, ProwlErrorKind::VALIDATION,
                        "token is required for retrieve api key operation");
        }
        if (config_.provider_key.size() != KEY_LENGTH) {
            return fail(out_error, ProwlErrorKind::VALIDATION,
                        "provider key is required for retrieve api key operation");
        }
        appendFormField(query, "providerkey", config_.provider_key);
        appendFormField(query, "token", config_.token);
    }

    HttpResponse http;
    std::string transport_error;
    bool ok = transport_->get(endpoint("retrieve/apikey") + "?" + query, &http, &transport_error);

    ProwlError error;
    ProwlResponse response;
    if (!handleResponse(ok, http, transport_error, RequestOrigin::OTHER, &response, &error)) {
        // 409: the user did not approve the token (yet)
        ProwlErrorKind kind = error.kind;
        if (kind == ProwlErrorKind::REMOTE && error.code == 409) {
            kind = ProwlErrorKind::NOT_APPROVED;
        }
        return fail(out_error, kind,
                    "retrieve api key request to prowl server failed: " + error.message, error.code);
    }
    if (!response.has_retrieve || response.retrieve_api_key.size() != KEY_LENGTH) {
        return fail(out_error, ProwlErrorKind::DECODE,
                    "retrieve api key request to prowl server failed: response carries no valid api key");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (api_keys_.insert(response.retrieve_api_key).second) {
            api_keys_dirty_ = true;
        }
    }
    if (out_api_key) *out_api_key = response.retrieve_api_key;
    if (out_error) out_error->clear();
    return true;
}

bool ProwlClient::handleResponse(bool transport_ok,
                                 const HttpResponse& http,
                                 const std::string& transport_error,
                                 RequestOrigin origin,
                                 ProwlResponse* out_response,
                                 ProwlError* out_error) {
    if (!transport_ok) {
        return fail(out_error, ProwlErrorKind::TRANSPORT,
                    "HTTP request to prowl server failed: " + transport_error);
    }

    ProwlResponse response;
    if (!decodeProwlResponse(http.body, &response, out_error)) {
        return false;
    }

    bool flagged = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (response.has_success) {
            reset_ = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(response.reset_date));
            remaining_ = response.remaining;
        }
        if (response.has_error && response.error_code == 401 && origin == RequestOrigin::ADD
            && !unauthorized_) {
            unauthorized_ = true;
            flagged = true;
        }
    }
    if (flagged) {
        logger_->warning("prowl rejected the api key; add requests are disabled for this client");
    }

    if (response.has_error) {
        return fail(out_error, ProwlErrorKind::REMOTE,
                    "prowl returned error code " + std::to_string(response.error_code) + ": "
                        + response.error_message,
                    response.error_code);
    }
    if (!response.has_success && (http.status < 200 || http.status >= 300)) {
        return fail(out_error, ProwlErrorKind::REMOTE,
                    "prowl returned HTTP status " + std::to_string(http.status),
                    static_cast<int>(http.status));
    }

    if (out_response) *out_response = std::move(response);
    return true;
}

std::string ProwlClient::makeApiKeyRequestArgument() const {
    std::string req;
    for (const auto& key : api_keys_) {
        if (!req.empty()) req += ",";
        req += key;
    }
    return req;
}

std::string ProwlClient::endpoint(const char* path) const {
    return config_.base_url + path;
}

void ProwlClient::sendLogged(int priority, const std::string& event, const std::string& message) {
    ProwlError error;
    if (!add(priority, event, message, nullptr, &error)) {
        logger_->warning("can't send prowl message (\"" + shorten(event, 10) + ": " + shorten(message, 20)
                         + "\") " + error.message);
    }
}

void ProwlClient::logWait(int priority, const std::string& event, const std::string& message,
                          std::chrono::milliseconds wait) {
    logger_->info(event + ": " + message + " " + *config_.to_prowl_label);

    if (wait == WAIT_SYNC) {
        sendLogged(priority, event, message);
        return;
    }

    auto done = std::make_shared<std::promise<void>>();
    std::future<void> sent = done->get_future();
    std::shared_ptr<ProwlClient> self = shared_from_this();
    std::thread([self, done, priority, event, message]() {
        self->sendLogged(priority, event, message);
        done->set_value();
    }).detach();

    if (sent.wait_for(wait) == std::future_status::timeout) {
        logger_->warning("Timeout while sending prowl message");
    }
}

void ProwlClient::log(int priority, const std::string& event, const std::string& message) {
    logWait(priority, event, message, config_.log_timeout);
}

void ProwlClient::logSync(int priority, const std::string& event, const std::string& message) {
    logWait(priority, event, message, WAIT_SYNC);
}

int ProwlClient::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remaining_;
}

std::chrono::system_clock::time_point ProwlClient::resetAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reset_;
}

bool ProwlClient::isUnauthorized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unauthorized_;
}

std::string ProwlClient::toString() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return "prowl client for application " + config_.application + ", " + std::to_string(remaining_)
           + " api requests left, reset at " + formatTime(reset_);
}

} // namespace prowl
