#ifndef PROWL_TESTS_MOCK_TRANSPORT_HPP
#define PROWL_TESTS_MOCK_TRANSPORT_HPP

#include "notifications/http_transport.hpp"

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace prowl_test {

const std::string BASE_URL = "http://prowl.test/publicapi/";

const std::string API_KEY = "e192384beae856efa6dda87d6a00837cf968bd8c";
const std::string API_KEY_2 = "e19238423ae856efa6ddadf34a00837cf968bd8c";
const std::string API_KEY_3 = "e17ef34beae856efa6dda87d6a0082130168bd8c";
const std::string PROVIDER_KEY = "0267157cc27a27f99ad23d1f785f0e7897df0d6b";
const std::string TOKEN = "c3fb7c3fb7c3fb7c3fb7c3fb7c3fb7c3fb7c3fb7";
const std::string NEW_API_KEY = "3fa013fa013fa013fa013fa013fa013fa013fa01";
const std::string APPROVE_URL = "https://www.prowlapp.com/retrieve.php?token=" + TOKEN;

inline std::string successXml(int remaining, int64_t resetdate) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<prowl>\n<success code=\"200\" remaining=\""
           + std::to_string(remaining) + "\" resetdate=\"" + std::to_string(resetdate) + "\" />\n</prowl>\n";
}

inline std::string errorXml(int code, const std::string& message) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<prowl>\n<error code=\"" + std::to_string(code) + "\">"
           + message + "</error>\n</prowl>\n";
}

inline std::string tokenXml(int remaining, int64_t resetdate) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<prowl>\n<success code=\"200\" remaining=\""
           + std::to_string(remaining) + "\" resetdate=\"" + std::to_string(resetdate) + "\" />\n"
           + "<retrieve token=\"" + TOKEN + "\" url=\"" + APPROVE_URL + "\" />\n</prowl>\n";
}

inline std::string apiKeyXml(int remaining, int64_t resetdate) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<prowl>\n<success code=\"200\" remaining=\""
           + std::to_string(remaining) + "\" resetdate=\"" + std::to_string(resetdate) + "\" />\n"
           + "<retrieve apikey=\"" + NEW_API_KEY + "\" />\n</prowl>\n";
}

const std::string INCOMPLETE_XML = "<prowl>\n<error code=\"500\">Somethign we\n";

inline std::string urlDecode(const std::string& in) {
    std::string out;
    for (size_t i = 0; i < in.size(); i++) {
        if (in[i] == '%' && i + 2 < in.size()) {
            out += static_cast<char>(std::strtol(in.substr(i + 1, 2).c_str(), nullptr, 16));
            i += 2;
        } else if (in[i] == '+') {
            out += ' ';
        } else {
            out += in[i];
        }
    }
    return out;
}

inline std::map<std::string, std::string> parseQuery(const std::string& query) {
    std::map<std::string, std::string> result;
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string pair = query.substr(pos, amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                result[urlDecode(pair)] = "";
            } else {
                result[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
            }
        }
        pos = amp + 1;
    }
    return result;
}

// In-process stand-in for the prowl server. Responses are registered per
// endpoint path ("add", "verify", "retrieve/token", "retrieve/apikey").
class MockTransport : public prowl::HttpTransport {
public:
    struct Request {
        std::string method;
        std::string path;
        std::map<std::string, std::string> params;
    };

    using Handler = std::function<bool(const Request&, prowl::HttpResponse*, std::string*)>;

    void respond(const std::string& path, long status, const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[path] = prowl::HttpResponse{status, body};
    }

    void failWith(const std::string& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        transport_error_ = error;
    }

    void setHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    size_t callCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    Request lastRequest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.empty() ? Request{} : requests_.back();
    }

    bool get(const std::string& url, prowl::HttpResponse* out_response, std::string* out_error) override {
        std::string path = url.substr(BASE_URL.size());
        std::string query;
        size_t q = path.find('?');
        if (q != std::string::npos) {
            query = path.substr(q + 1);
            path = path.substr(0, q);
        }
        return dispatch(Request{"GET", path, parseQuery(query)}, out_response, out_error);
    }

    bool postForm(const std::string& url, const std::string& form_body,
                  prowl::HttpResponse* out_response, std::string* out_error) override {
        return dispatch(Request{"POST", url.substr(BASE_URL.size()), parseQuery(form_body)},
                        out_response, out_error);
    }

private:
    bool dispatch(const Request& request, prowl::HttpResponse* out_response, std::string* out_error) {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            handler = handler_;
            if (!handler) {
                if (!transport_error_.empty()) {
                    *out_error = transport_error_;
                    return false;
                }
                auto it = responses_.find(request.path);
                if (it == responses_.end()) {
                    *out_response = prowl::HttpResponse{404, ""};
                } else {
                    *out_response = it->second;
                }
                return true;
            }
        }
        return handler(request, out_response, out_error);
    }

    mutable std::mutex mutex_;
    std::map<std::string, prowl::HttpResponse> responses_;
    std::string transport_error_;
    Handler handler_;
    std::vector<Request> requests_;
};

} // namespace prowl_test

#endif // PROWL_TESTS_MOCK_TRANSPORT_HPP
