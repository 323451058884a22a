#include "isoboot/dependency_check.hpp"

namespace isoboot {

std::vector<std::string> RequiredCommands(WriteBackend backend, bool is_root) {
    std::vector<std::string> commands{"lsblk", "umount", "wget", "eject"};
    if (backend != WriteBackend::Direct) {
        commands.emplace_back("dd");
    }
    if (!is_root) {
        commands.emplace_back("sudo");
    }
    return commands;
}

Result CheckDependencies(const ISystemOps& ops, const std::vector<std::string>& commands) {
    for (const auto& cmd : commands) {
        if (!ops.CommandExists(cmd)) {
            return Result::Fail(ErrorKind::DependencyMissing, -1,
                                "Error: " + cmd + " is not installed. Please install it first.");
        }
    }
    return Result::Ok();
}

} // namespace isoboot
