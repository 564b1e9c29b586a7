#ifndef PROWL_HTTP_TRANSPORT_HPP
#define PROWL_HTTP_TRANSPORT_HPP

#include <memory>
#include <string>

namespace prowl {

class Logger;

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Blocking HTTP client used by ProwlClient. Implementations must be safe to
// call from several threads at once.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Both return false and set out_error only when no HTTP response was
    // received. Non-2xx statuses are returned in out_response.
    virtual bool get(const std::string& url,
                     HttpResponse* out_response,
                     std::string* out_error) = 0;

    virtual bool postForm(const std::string& url,
                          const std::string& form_body,
                          HttpResponse* out_response,
                          std::string* out_error) = 0;
};

// Failed requests are logged at debug level to the given logger, if any.
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(long timeout_seconds = 30,
                           std::shared_ptr<Logger> logger = nullptr);

    bool get(const std::string& url,
             HttpResponse* out_response,
             std::string* out_error) override;

    bool postForm(const std::string& url,
                  const std::string& form_body,
                  HttpResponse* out_response,
                  std::string* out_error) override;

private:
    long timeout_seconds_;
    std::shared_ptr<Logger> logger_;
};

std::string urlEncode(const std::string& input);
void appendFormField(std::string& body, const std::string& key, const std::string& value);

} // namespace prowl

#endif // PROWL_HTTP_TRANSPORT_HPP
