#ifndef PROWL_CLIENT_HPP
#define PROWL_CLIENT_HPP

#include "http_transport.hpp"
#include "prowl_config.hpp"
#include "prowl_error.hpp"
#include "prowl_response.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace prowl {

class Logger;

namespace priority {
constexpr int VERY_LOW = -2;
constexpr int MODERATE = -1;
constexpr int NORMAL = 0;
constexpr int HIGH = 1;
constexpr int EMERGENCY = 2;
} // namespace priority

constexpr size_t MAX_EVENT_LENGTH = 1024;
constexpr size_t MAX_DESCRIPTION_LENGTH = 10000;
constexpr size_t MAX_URL_LENGTH = 256;
constexpr int INITIAL_REMAINING = 1000;

struct ProwlNotification {
    int priority = priority::NORMAL;
    std::string event;
    std::string description;
    std::string url;
    // Append the url to the description so it is visible in the message
    // body, not only behind the (i) button of the app.
    bool embed_url = true;
};

// Client for the prowl push notification api (http://www.prowlapp.com/api.php).
//
//  - send()/add()/addWithUrl() deliver messages to all configured api keys
//  - verify() checks a single api key
//  - retrieveToken() + retrieveApiKey() acquire a new api key once the user
//    approved the request at the returned url
//  - log()/logSync() write to the logger and notify in one call
//
// Instances are shared between threads and must be owned by a shared_ptr,
// which create() guarantees.
class ProwlClient : public std::enable_shared_from_this<ProwlClient> {
public:
    static std::shared_ptr<ProwlClient> create(const ProwlConfig& config, ProwlError* out_error = nullptr);

    bool addApiKey(const std::string& api_key, ProwlError* out_error = nullptr);
    bool removeApiKey(const std::string& api_key, ProwlError* out_error = nullptr);
    bool hasApiKey(const std::string& api_key) const;
    size_t apiKeyCount() const;

    // Snapshot of the current configuration, suitable for persisting and
    // feeding into create() later on. Includes the token and keys acquired
    // through retrieveToken()/retrieveApiKey().
    ProwlConfig config();

    bool send(const ProwlNotification& notification,
              int* out_remaining = nullptr,
              ProwlError* out_error = nullptr);

    bool add(int priority,
             const std::string& event,
             const std::string& description,
             int* out_remaining = nullptr,
             ProwlError* out_error = nullptr);

    bool addWithUrl(int priority,
                    const std::string& event,
                    const std::string& description,
                    const std::string& url,
                    int* out_remaining = nullptr,
                    ProwlError* out_error = nullptr);

    // Costs one api call. Never marks the client unauthorized.
    bool verify(const std::string& api_key,
                int* out_remaining = nullptr,
                ProwlError* out_error = nullptr);

    bool retrieveToken(std::string* out_approve_url, ProwlError* out_error = nullptr);
    bool retrieveApiKey(std::string* out_api_key, ProwlError* out_error = nullptr);

    // Logs "<event>: <message> <label>" and sends the message. log() waits at
    // most config.log_timeout, logSync() until the request returns. Send
    // errors only go to the logger. After a timeout the send keeps running
    // on its own thread and may outlive the call.
    void log(int priority, const std::string& event, const std::string& message);
    void logSync(int priority, const std::string& event, const std::string& message);

    int remaining() const;
    std::chrono::system_clock::time_point resetAt() const;
    bool isUnauthorized() const;
    std::string toString() const;

private:
    explicit ProwlClient(const ProwlConfig& config);

    enum class RequestOrigin {
        ADD,
        OTHER
    };

    bool handleResponse(bool transport_ok,
                        const HttpResponse& http,
                        const std::string& transport_error,
                        RequestOrigin origin,
                        ProwlResponse* out_response,
                        ProwlError* out_error);

    std::string makeApiKeyRequestArgument() const;
    std::string endpoint(const char* path) const;
    void sendLogged(int priority, const std::string& event, const std::string& message);
    void logWait(int priority, const std::string& event, const std::string& message,
                 std::chrono::milliseconds wait);

    mutable std::mutex mutex_;
    ProwlConfig config_;
    std::set<std::string> api_keys_;
    bool api_keys_dirty_ = false;
    bool unauthorized_ = false;
    int remaining_ = INITIAL_REMAINING;
    std::chrono::system_clock::time_point reset_;

    std::shared_ptr<Logger> logger_;
    std::shared_ptr<HttpTransport> transport_;
};

} // namespace prowl

#endif // PROWL_CLIENT_HPP
