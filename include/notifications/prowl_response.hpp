#ifndef PROWL_RESPONSE_HPP
#define PROWL_RESPONSE_HPP

#include "prowl_error.hpp"

#include <cstdint>
#include <string>

namespace prowl {

// Decoded <prowl> document. Each element is optional; the has_* flags tell
// which ones were present.
struct ProwlResponse {
    bool has_error = false;
    int error_code = 0;
    std::string error_message;

    bool has_success = false;
    int success_code = 0;
    int remaining = 0;
    int64_t reset_date = 0;  // unix seconds

    bool has_retrieve = false;
    std::string retrieve_api_key;
    std::string retrieve_token;
    std::string retrieve_url;
};

bool decodeProwlResponse(const std::string& body, ProwlResponse* out_response, ProwlError* out_error);

} // namespace prowl

#endif // PROWL_RESPONSE_HPP
