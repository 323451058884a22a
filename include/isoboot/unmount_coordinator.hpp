#pragma once

#include "isoboot/privilege_gate.hpp"
#include "isoboot/prompt.hpp"
#include "isoboot/session.hpp"
#include "system/system_ops.hpp"

#include <string>

namespace isoboot {

struct UnmountOutcome {
    enum class Kind {
        Skipped,   // operator declined or gave no path
        Unmounted,
        Warned,    // elevation or umount failed; the session goes on
        Exit,
    };

    Kind kind = Kind::Skipped;
    std::string path;
    std::string reason;
};

const char* ToString(UnmountOutcome::Kind kind);

// Optional unmount before device selection. Failure is never fatal: the
// device validator rejects a target that is still mounted.
class UnmountCoordinator {
public:
    UnmountCoordinator(Prompter& prompter, const ISystemOps& ops, const PrivilegeGate& gate);

    UnmountOutcome MaybeUnmount(Session& session);

private:
    Prompter& prompter_;
    const ISystemOps& ops_;
    const PrivilegeGate& gate_;
};

} // namespace isoboot
