#include "isoboot/unmount_coordinator.hpp"

#include "util/logger.hpp"

#include <ostream>

namespace isoboot {

const char* ToString(UnmountOutcome::Kind kind) {
    switch (kind) {
        case UnmountOutcome::Kind::Skipped:   return "Skipped";
        case UnmountOutcome::Kind::Unmounted: return "Unmounted";
        case UnmountOutcome::Kind::Warned:    return "Warned";
        case UnmountOutcome::Kind::Exit:      return "Exit";
    }
    return "Unknown";
}

UnmountCoordinator::UnmountCoordinator(Prompter& prompter, const ISystemOps& ops, const PrivilegeGate& gate)
    : prompter_(prompter), ops_(ops), gate_(gate) {}

UnmountOutcome UnmountCoordinator::MaybeUnmount(Session& session) {
    UnmountOutcome outcome;

    switch (prompter_.AskYesNo("Do you want to unmount a disk?")) {
        case YesNo::Exit:
            outcome.kind = UnmountOutcome::Kind::Exit;
            return outcome;
        case YesNo::No:
            return outcome;
        case YesNo::Yes:
            break;
    }
    session.unmount_requested = true;

    auto path = prompter_.AskText("Enter the path to unmount (e.g., /mnt/usb)");
    if (!path) {
        outcome.kind = UnmountOutcome::Kind::Exit;
        return outcome;
    }
    if (path->empty()) {
        return outcome;
    }
    outcome.path = *path;

    std::ostream& out = prompter_.Out();
    out << "Unmounting " << outcome.path << "...\n" << std::flush;

    auto gate_res = gate_.EnsureElevated();
    if (!gate_res.is_ok()) {
        outcome.kind = UnmountOutcome::Kind::Warned;
        outcome.reason = gate_res.msg;
        out << "Error unmounting " << outcome.path << " (" << outcome.reason << ")\n";
        return outcome;
    }

    auto res = ops_.Unmount(outcome.path);
    if (!res.is_ok()) {
        LogWarn("unmount %s: %s", outcome.path.c_str(), res.msg.c_str());
        outcome.kind = UnmountOutcome::Kind::Warned;
        outcome.reason = res.msg;
        out << "Error unmounting " << outcome.path << " (" << outcome.reason << ")\n";
        return outcome;
    }

    session.unmounted_path = outcome.path;
    outcome.kind = UnmountOutcome::Kind::Unmounted;
    out << "Unmounted " << outcome.path << "\n";
    return outcome;
}

} // namespace isoboot
