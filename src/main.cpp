#include "isoboot/dependency_check.hpp"
#include "isoboot/device_validator.hpp"
#include "isoboot/image_acquirer.hpp"
#include "isoboot/privilege_gate.hpp"
#include "isoboot/prompt.hpp"
#include "isoboot/session.hpp"
#include "isoboot/write_orchestrator.hpp"
#include "system/system_ops.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

void PrintUsage(std::FILE* out, const char* argv0) {
    std::fprintf(out,
        "\n"
        "==========================\n"
        "ISO USB BOOTMAKER\n"
        "==========================\n"
        "\n"
        "Writes a bootable ISO image onto a USB drive.\n"
        "\n"
        "Usage:\n"
        "   %s          interactive mode\n"
        "   %s help     show this help\n"
        "\n"
        "Steps:\n"
        "1. Shows the current disk layout.\n"
        "2. Prompts for a path to unmount (optional).\n"
        "3. Prompts for the disk to format (e.g., /dev/sdb). Must be a valid,\n"
        "   unmounted, non-system block device.\n"
        "4. Prompts for the ISO path or download URL and validates the file.\n"
        "5. Confirms the formatting operation.\n"
        "6. Writes the ISO to the USB drive.\n"
        "7. Optionally ejects the USB drive.\n"
        "\n"
        "Type 'exit' at any prompt to quit without writing anything.\n"
        "\n"
        "Requirements: lsblk, umount, dd, wget, eject, sudo (when not root)\n"
        "\n"
        "Configuration: $%s or %s (JSON, optional)\n"
        "Log level: $%s (debug, info, warn, error, none)\n"
        "\n",
        argv0,
        argv0,
        isoboot::kConfigPathEnv,
        isoboot::kDefaultConfigPath,
        isoboot::kLogLevelEnv);
}

bool IsHelpArg(const char* arg) {
    return std::strcmp(arg, "help") == 0 || std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0;
}

isoboot::Config LoadConfig(const isoboot::EnvLookup& env) {
    isoboot::Config cfg;
    const std::string path = isoboot::ConfigPathFromEnvironment(env);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LogDebug("no config at %s, using defaults", path.c_str());
        return cfg;
    }

    auto res = isoboot::Config::LoadFromFile(path, cfg);
    if (!res.is_ok()) {
        LogWarn("%s; using defaults", res.msg.c_str());
    }
    return cfg;
}

void ApplyLogLevel(const isoboot::Config& cfg, const isoboot::EnvLookup& env) {
    if (cfg.log_level) {
        isoboot::Logger::Instance().SetLevel(*cfg.log_level);
    }
    if (auto v = env(isoboot::kLogLevelEnv); v && !v->empty()) {
        if (auto lvl = isoboot::ParseLogLevel(*v)) {
            isoboot::Logger::Instance().SetLevel(*lvl);
        } else {
            LogWarn("ignoring invalid %s=%s", isoboot::kLogLevelEnv, v->c_str());
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 2 || (argc == 2 && !IsHelpArg(argv[1]))) {
        PrintUsage(stderr, argv[0]);
        return 1;
    }
    if (argc == 2) {
        PrintUsage(stdout, argv[0]);
        return 0;
    }

    const isoboot::EnvLookup env = isoboot::ProcessEnvironment();
    const isoboot::Config cfg = LoadConfig(env);
    ApplyLogLevel(cfg, env);

    isoboot::PosixSystemOps ops(cfg.mount_table, env);

    const isoboot::WriteBackend backend = isoboot::ResolveWriteBackend(cfg.write_backend, ops.IsRoot());
    if (cfg.write_backend == isoboot::WriteBackend::Direct && backend != isoboot::WriteBackend::Direct) {
        LogWarn("WriteBackend=direct needs root; falling back to dd");
    }

    auto deps = isoboot::CheckDependencies(ops, isoboot::RequiredCommands(backend, ops.IsRoot()));
    if (!deps.is_ok()) {
        std::cout << deps.msg << std::endl;
        return 1;
    }

    isoboot::Prompter prompter(std::cin, std::cout);
    isoboot::DeviceValidator validator(ops, {.system_disk = cfg.system_disk, .device_pattern = cfg.device_pattern});
    isoboot::ImageAcquirer acquirer(ops,
                                    {.extension = cfg.image_extension, .download_dir = cfg.download_dir},
                                    std::cout,
                                    env);
    isoboot::PrivilegeGate gate(ops, std::cout);

    isoboot::WriteOrchestrator orchestrator(prompter,
                                            ops,
                                            validator,
                                            acquirer,
                                            gate,
                                            {.backend = backend,
                                             .block_size_bytes = cfg.block_size_bytes,
                                             .fsync_interval_bytes = cfg.fsync_interval_bytes});

    isoboot::Session session;
    const isoboot::OrchestratorOutcome outcome = orchestrator.Run(session);
    if (outcome == isoboot::OrchestratorOutcome::Cancelled) {
        std::cout << "Exiting..." << std::endl;
    }
    return isoboot::ExitCodeFor(outcome);
}
