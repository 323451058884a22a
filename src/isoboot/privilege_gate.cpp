#include "isoboot/privilege_gate.hpp"

#include "util/logger.hpp"

#include <ostream>

namespace isoboot {

PrivilegeGate::PrivilegeGate(const ISystemOps& ops, std::ostream& out) : ops_(ops), out_(out) {}

Result PrivilegeGate::EnsureElevated() const {
    if (ops_.IsRoot()) return Result::Ok();

    out_ << "Requesting sudo privileges...\n" << std::flush;
    auto res = ops_.ElevateCredentials();
    if (!res.is_ok()) {
        LogWarn("elevation failed: %s", res.msg.c_str());
        out_ << "Failed to obtain sudo privileges\n";
        return Result::Fail(ErrorKind::PrivilegeDenied, res.err, "Failed to obtain sudo privileges");
    }
    return Result::Ok();
}

} // namespace isoboot
