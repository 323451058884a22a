#include "isoboot/write_orchestrator.hpp"

#include "isoboot/unmount_coordinator.hpp"
#include "util/logger.hpp"

#include <array>
#include <ostream>
#include <utility>

namespace isoboot {

const char* ToString(State s) {
    switch (s) {
        case State::Start:        return "Start";
        case State::ShowLayout:   return "ShowLayout";
        case State::Unmount:      return "Unmount";
        case State::SelectTarget: return "SelectTarget";
        case State::SelectImage:  return "SelectImage";
        case State::ConfirmWrite: return "ConfirmWrite";
        case State::Write:        return "Write";
        case State::Sync:         return "Sync";
        case State::OfferEject:   return "OfferEject";
        case State::Done:         return "Done";
    }
    return "Unknown";
}

const char* ToString(OrchestratorOutcome o) {
    switch (o) {
        case OrchestratorOutcome::Completed:   return "Completed";
        case OrchestratorOutcome::Cancelled:   return "Cancelled";
        case OrchestratorOutcome::Declined:    return "Declined";
        case OrchestratorOutcome::WriteFailed: return "WriteFailed";
        case OrchestratorOutcome::EjectFailed: return "EjectFailed";
    }
    return "Unknown";
}

int ExitCodeFor(OrchestratorOutcome o) {
    switch (o) {
        case OrchestratorOutcome::Completed:
        case OrchestratorOutcome::Cancelled:
        case OrchestratorOutcome::Declined:
            return 0;
        case OrchestratorOutcome::WriteFailed:
        case OrchestratorOutcome::EjectFailed:
            return 1;
    }
    return 1;
}

WriteOrchestrator::WriteOrchestrator(Prompter& prompter,
                                     const ISystemOps& ops,
                                     const DeviceValidator& validator,
                                     const ImageAcquirer& acquirer,
                                     const PrivilegeGate& gate,
                                     WriteSettings settings)
    : prompter_(prompter), ops_(ops), validator_(validator), acquirer_(acquirer), gate_(gate),
      settings_(settings) {}

void WriteOrchestrator::Enter(State s) {
    state_ = s;
    trace_.push_back(s);
    LogDebug("state -> %s", ToString(s));
}

OrchestratorOutcome WriteOrchestrator::Finish(Step step) const {
    switch (step) {
        case Step::Cancelled: return OrchestratorOutcome::Cancelled;
        case Step::Declined:  return OrchestratorOutcome::Declined;
        case Step::Advance:   return OrchestratorOutcome::Completed;
        case Step::Failed:    break;
    }
    return state_ == State::OfferEject ? OrchestratorOutcome::EjectFailed : OrchestratorOutcome::WriteFailed;
}

OrchestratorOutcome WriteOrchestrator::Run(Session& session) {
    using Handler = Step (WriteOrchestrator::*)(Session&);
    static constexpr std::array<std::pair<State, Handler>, 8> kPipeline{{
        {State::ShowLayout, &WriteOrchestrator::ShowLayout},
        {State::Unmount, &WriteOrchestrator::Unmount},
        {State::SelectTarget, &WriteOrchestrator::SelectTarget},
        {State::SelectImage, &WriteOrchestrator::SelectImage},
        {State::ConfirmWrite, &WriteOrchestrator::ConfirmWrite},
        {State::Write, &WriteOrchestrator::Write},
        {State::Sync, &WriteOrchestrator::Sync},
        {State::OfferEject, &WriteOrchestrator::OfferEject},
    }};

    trace_.clear();
    Enter(State::Start);

    if (session.TargetDevice() || session.ImagePath()) {
        LogError("refusing to run on a session that already has a target or image");
        return OrchestratorOutcome::WriteFailed;
    }

    for (const auto& [state, handler] : kPipeline) {
        Enter(state);
        const Step step = (this->*handler)(session);
        if (step != Step::Advance) {
            const OrchestratorOutcome outcome = Finish(step);
            LogInfo("session ended in %s: %s", ToString(state_), ToString(outcome));
            return outcome;
        }
    }

    Enter(State::Done);
    prompter_.Out() << "\nISO bootable USB created successfully!\n\n" << std::flush;
    return OrchestratorOutcome::Completed;
}

WriteOrchestrator::Step WriteOrchestrator::ShowLayout(Session&) {
    std::ostream& out = prompter_.Out();
    out << "\nCurrent disk layout:\n\n";

    const auto lines = validator_.ListDevices();
    if (lines.empty()) {
        out << "(block device listing unavailable)\n";
    }
    for (const auto& line : lines) {
        out << line << "\n";
    }
    out << "\nThis is your current disk layout. Consider this before proceeding.\n\n";

    return prompter_.AskContinue() == ContinueReply::Exit ? Step::Cancelled : Step::Advance;
}

WriteOrchestrator::Step WriteOrchestrator::Unmount(Session& session) {
    UnmountCoordinator coordinator(prompter_, ops_, gate_);
    const UnmountOutcome outcome = coordinator.MaybeUnmount(session);
    LogDebug("unmount stage: %s %s", ToString(outcome.kind), outcome.path.c_str());
    return outcome.kind == UnmountOutcome::Kind::Exit ? Step::Cancelled : Step::Advance;
}

WriteOrchestrator::Step WriteOrchestrator::SelectTarget(Session& session) {
    std::ostream& out = prompter_.Out();
    while (true) {
        auto input = prompter_.AskText("Enter the disk to format (e.g., /dev/sdb)");
        if (!input) return Step::Cancelled;

        auto candidate = validator_.ValidateTarget(*input);
        if (!candidate) {
            out << DescribeRejection(candidate.error(), *input) << "\n";
            continue;
        }

        auto assigned = session.AssignTarget(*candidate);
        if (!assigned.is_ok()) {
            LogError("%s", assigned.msg.c_str());
            return Step::Failed;
        }
        return Step::Advance;
    }
}

WriteOrchestrator::Step WriteOrchestrator::SelectImage(Session& session) {
    std::ostream& out = prompter_.Out();
    while (true) {
        out << "\nYou can either:\n"
            << "1. Provide the path to a local ISO\n"
            << "2. Provide a download URL for the ISO\n\n";

        auto input = prompter_.AskText("Enter the ISO path or URL");
        if (!input) return Step::Cancelled;

        auto image = input->empty() ? std::expected<ValidatedImage, ImageRejection>(
                                          std::unexpected(ImageRejection::FileMissing))
                                    : acquirer_.ResolveImage(*input);
        if (!image) {
            if (image.error() == ImageRejection::NetworkError) {
                out << "Error: Failed to download or validate ISO file.\n";
            } else {
                out << "Error: Invalid ISO file. Please provide a valid path to a " << acquirer_.Extension()
                    << " file or a download URL.\n";
            }
            continue;
        }

        auto assigned = session.AssignImage(*image);
        if (!assigned.is_ok()) {
            LogError("%s", assigned.msg.c_str());
            return Step::Failed;
        }
        return Step::Advance;
    }
}

WriteOrchestrator::Step WriteOrchestrator::ConfirmWrite(Session& session) {
    const std::string question =
        "Are you sure you want to format " + *session.TargetDevice() + "? This will ERASE ALL DATA";

    switch (prompter_.AskYesNo(question)) {
        case YesNo::Exit:
            return Step::Cancelled;
        case YesNo::No:
            prompter_.Out() << "\nOperation cancelled.\n\n" << std::flush;
            return Step::Declined;
        case YesNo::Yes:
            break;
    }
    session.confirmed = true;
    return Step::Advance;
}

WriteOrchestrator::Step WriteOrchestrator::Write(Session& session) {
    std::ostream& out = prompter_.Out();

    if (!session.confirmed) {
        LogError("write reached without confirmation");
        return Step::Failed;
    }

    auto gate_res = gate_.EnsureElevated();
    if (!gate_res.is_ok()) {
        out << "Error writing ISO to USB drive: " << gate_res.msg << "\n";
        return Step::Failed;
    }

    out << "Writing ISO to USB drive... This may take several minutes...\n" << std::flush;

    WriteRequest req;
    req.image_path = *session.ImagePath();
    req.device_path = *session.TargetDevice();
    req.backend = settings_.backend;
    req.block_size_bytes = settings_.block_size_bytes;
    req.fsync_interval_bytes = settings_.fsync_interval_bytes;

    LogInfo("writing %s -> %s (backend=%s, bs=%llu)",
            req.image_path.c_str(),
            req.device_path.c_str(),
            isoboot::ToString(req.backend),
            (unsigned long long)req.block_size_bytes);

    auto res = ops_.WriteImage(req);
    if (!res.is_ok()) {
        LogError("write failed: %s", res.msg.c_str());
        out << "Error writing ISO to USB drive: " << res.msg << "\n";
        return Step::Failed;
    }

    out << "ISO successfully written to USB drive\n";
    return Step::Advance;
}

WriteOrchestrator::Step WriteOrchestrator::Sync(Session&) {
    ops_.SyncAll();
    return Step::Advance;
}

WriteOrchestrator::Step WriteOrchestrator::OfferEject(Session& session) {
    std::ostream& out = prompter_.Out();

    switch (prompter_.AskYesNo("Do you want to eject the disk?")) {
        case YesNo::Exit:
            return Step::Cancelled;
        case YesNo::No:
            return Step::Advance;
        case YesNo::Yes:
            break;
    }
    session.eject_requested = true;

    const std::string& device = *session.TargetDevice();
    out << "Ejecting " << device << "...\n" << std::flush;

    auto gate_res = gate_.EnsureElevated();
    if (!gate_res.is_ok()) {
        out << "Error ejecting disk: " << gate_res.msg << "\n";
        return Step::Failed;
    }

    auto res = ops_.Eject(device);
    if (!res.is_ok()) {
        LogError("eject %s failed: %s", device.c_str(), res.msg.c_str());
        out << "Error ejecting disk: " << res.msg << "\n";
        return Step::Failed;
    }

    out << "Disk ejected successfully\n";
    return Step::Advance;
}

} // namespace isoboot
