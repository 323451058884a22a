#include "util/result.hpp"

namespace isoboot {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return "None";
        case ErrorKind::UserCancelled:       return "UserCancelled";
        case ErrorKind::ValidationRejected:  return "ValidationRejected";
        case ErrorKind::PrivilegeDenied:     return "PrivilegeDenied";
        case ErrorKind::ExternalToolFailure: return "ExternalToolFailure";
        case ErrorKind::DependencyMissing:   return "DependencyMissing";
        case ErrorKind::IoError:             return "IoError";
    }
    return "Unknown";
}

} // namespace isoboot
