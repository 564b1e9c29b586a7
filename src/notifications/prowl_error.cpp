#include "../../include/notifications/prowl_error.hpp"

namespace prowl {

void ProwlError::clear() {
    kind = ProwlErrorKind::NONE;
    code = 0;
    message.clear();
}

std::string errorKindToString(ProwlErrorKind kind) {
    switch (kind) {
        case ProwlErrorKind::NONE: return "none";
        case ProwlErrorKind::VALIDATION: return "validation";
        case ProwlErrorKind::TRANSPORT: return "transport";
        case ProwlErrorKind::DECODE: return "decode";
        case ProwlErrorKind::REMOTE: return "remote";
        case ProwlErrorKind::UNAUTHORIZED: return "unauthorized";
        case ProwlErrorKind::RATE_LIMITED: return "rate limited";
        case ProwlErrorKind::NOT_APPROVED: return "not approved";
        default: return "unknown";
    }
}

bool fail(ProwlError* out_error, ProwlErrorKind kind, const std::string& message, int code) {
    if (out_error) {
        out_error->kind = kind;
        out_error->code = code;
        out_error->message = message;
    }
    return false;
}

} // namespace prowl
