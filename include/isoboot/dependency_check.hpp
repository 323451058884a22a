#pragma once

#include "system/system_ops.hpp"
#include "util/config.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace isoboot {

// External utilities this run will need, given the resolved write backend.
std::vector<std::string> RequiredCommands(WriteBackend backend, bool is_root);

// Fails with DependencyMissing naming the first command that is not found.
Result CheckDependencies(const ISystemOps& ops, const std::vector<std::string>& commands);

} // namespace isoboot
