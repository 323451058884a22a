#include "system/process.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace isoboot {

namespace {

std::vector<char*> BuildArgv(const std::vector<std::string>& argv) {
    std::vector<char*> out;
    out.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        out.push_back(const_cast<char*>(a.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

Result WaitChild(pid_t pid, const std::string& name, int& exit_code) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return Result::Fail(ErrorKind::ExternalToolFailure,
                            errno,
                            "waitpid failed for " + name + " (" + std::strerror(errno) + ")");
    }

    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code = kSignalExitBase + WTERMSIG(status);
    } else {
        exit_code = -1;
    }
    LogDebug("%s exited with %d", name.c_str(), exit_code);
    return Result::Ok();
}

Result Spawn(const std::vector<std::string>& argv,
             std::vector<std::string>* out_lines,
             int& exit_code) {
    if (argv.empty() || argv[0].empty()) {
        return Result::Fail(ErrorKind::ExternalToolFailure, EINVAL, "empty command line");
    }
    std::vector<char*> cargv = BuildArgv(argv);

    Fd read_end;
    Fd write_end;
    if (out_lines) {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) < 0) {
            return Result::Fail(ErrorKind::ExternalToolFailure,
                                errno,
                                "pipe failed (" + std::string(std::strerror(errno)) + ")");
        }
        read_end.Reset(fds[0]);
        write_end.Reset(fds[1]);
    }

    LogDebug("exec: %s (%zu args)", argv[0].c_str(), argv.size() - 1);

    const pid_t pid = ::fork();
    if (pid < 0) {
        return Result::Fail(ErrorKind::ExternalToolFailure,
                            errno,
                            "fork failed (" + std::string(std::strerror(errno)) + ")");
    }

    if (pid == 0) { // child
        if (out_lines && ::dup2(write_end.Get(), STDOUT_FILENO) < 0) {
            ::_exit(kExecFailedExit);
        }
        ::execvp(cargv[0], cargv.data());
        ::_exit(kExecFailedExit);
    }

    // parent
    if (out_lines) {
        (void)write_end.Close();
        std::string pending;
        char buf[4096];
        while (true) {
            const ssize_t n = ::read(read_end.Get(), buf, sizeof(buf));
            if (n > 0) {
                pending.append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            break;
        }
        size_t start = 0;
        while (start < pending.size()) {
            size_t nl = pending.find('\n', start);
            if (nl == std::string::npos) nl = pending.size();
            out_lines->push_back(pending.substr(start, nl - start));
            start = nl + 1;
        }
    }

    return WaitChild(pid, argv[0], exit_code);
}

bool IsExecutableFile(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

} // namespace

Result RunProcess(const std::vector<std::string>& argv, int& exit_code) {
    return Spawn(argv, nullptr, exit_code);
}

Result RunProcessCapture(const std::vector<std::string>& argv,
                         std::vector<std::string>& out_lines,
                         int& exit_code) {
    out_lines.clear();
    return Spawn(argv, &out_lines, exit_code);
}

std::optional<std::string> FindExecutable(std::string_view name, const EnvLookup& env) {
    if (name.empty()) return std::nullopt;

    const std::string n(name);
    if (n.find('/') != std::string::npos) {
        if (IsExecutableFile(n)) return n;
        return std::nullopt;
    }

    std::string path_var = "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
    if (env) {
        if (auto v = env("PATH"); v && !v->empty()) path_var = *v;
    }

    size_t start = 0;
    while (start <= path_var.size()) {
        size_t colon = path_var.find(':', start);
        if (colon == std::string::npos) colon = path_var.size();
        std::string dir = path_var.substr(start, colon - start);
        if (dir.empty()) dir = ".";
        const std::string candidate = dir + "/" + n;
        if (IsExecutableFile(candidate)) return candidate;
        start = colon + 1;
    }
    return std::nullopt;
}

} // namespace isoboot
