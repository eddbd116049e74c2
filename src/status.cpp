#include "objfs/status.hpp"

namespace objfs {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Ok: return "OK";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::ObjectChanged: return "ObjectChanged";
        case ErrorKind::Transient: return "Transient";
        case ErrorKind::Unavailable: return "Unavailable";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

std::string Status::ToString() const {
    if (ok()) {
        return "OK";
    }
    std::string out = ErrorKindName(kind_);
    if (!message_.empty()) {
        out += ": ";
        out += message_;
    }
    return out;
}

} // namespace objfs
