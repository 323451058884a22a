#pragma once

#include "util/path_utils.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace isoboot {

// Exit status reported for a child killed by a signal: 128 + signal number,
// matching what a shell would report.
inline constexpr int kSignalExitBase = 128;
// Exit status of a child whose execvp() failed.
inline constexpr int kExecFailedExit = 127;

// Runs argv[0] (resolved through PATH) with the given arguments and waits for
// it. No shell is involved; every element is passed verbatim. The child
// shares this process's stdin, stdout and stderr. A non-ok Result means the
// child could not be started or waited for; otherwise |exit_code| holds its
// status.
Result RunProcess(const std::vector<std::string>& argv, int& exit_code);

// Same as RunProcess but collects the child's stdout split into lines
// (trailing newline removed). stderr stays attached to the terminal.
Result RunProcessCapture(const std::vector<std::string>& argv,
                         std::vector<std::string>& out_lines,
                         int& exit_code);

// Absolute path of an executable named |name| found through $PATH, or |name|
// itself when it already contains a slash and is executable.
std::optional<std::string> FindExecutable(std::string_view name, const EnvLookup& env);

} // namespace isoboot
