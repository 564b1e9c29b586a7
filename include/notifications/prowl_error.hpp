#ifndef PROWL_ERROR_HPP
#define PROWL_ERROR_HPP

#include <string>

namespace prowl {

enum class ProwlErrorKind {
    NONE,
    VALIDATION,    // bad argument or configuration, nothing was sent
    TRANSPORT,     // HTTP request did not complete
    DECODE,        // response body is not a usable prowl document
    REMOTE,        // prowl answered with an error element
    UNAUTHORIZED,  // an earlier add was rejected with 401
    RATE_LIMITED,  // no api calls left until the reset date
    NOT_APPROVED   // user has not approved the token yet, retry later
};

struct ProwlError {
    ProwlErrorKind kind = ProwlErrorKind::NONE;
    // Prowl error code or HTTP status. 0 for errors raised locally.
    int code = 0;
    std::string message;

    bool ok() const { return kind == ProwlErrorKind::NONE; }
    void clear();
};

std::string errorKindToString(ProwlErrorKind kind);

// Fills out_error (if given) and returns false so callers can
// `return fail(out_error, ...);`.
bool fail(ProwlError* out_error, ProwlErrorKind kind, const std::string& message, int code = 0);

} // namespace prowl

#endif // PROWL_ERROR_HPP
