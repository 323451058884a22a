#pragma once
#include <string>
#include <utility>

namespace isoboot {

enum class ErrorKind : int {
    None = 0,
    UserCancelled,
    ValidationRejected,
    PrivilegeDenied,
    ExternalToolFailure,
    DependencyMissing,
    IoError,
};

const char* ToString(ErrorKind kind);

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    int err{0}; // errno or child exit status, 0 when not applicable
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, int e, std::string m) {
        return {.ok = false, .kind = k, .err = e, .msg = std::move(m)};
    }
    static Result Io(int e, std::string m) { return Fail(ErrorKind::IoError, e, std::move(m)); }
};

} // namespace isoboot
