#pragma once

#include "system/system_ops.hpp"
#include "util/result.hpp"

#include <iosfwd>

namespace isoboot {

// Consulted right before each privileged action, never up front.
class PrivilegeGate {
public:
    PrivilegeGate(const ISystemOps& ops, std::ostream& out);

    // Ok when already root or when sudo credentials could be validated;
    // PrivilegeDenied otherwise.
    Result EnsureElevated() const;

private:
    const ISystemOps& ops_;
    std::ostream& out_;
};

} // namespace isoboot
