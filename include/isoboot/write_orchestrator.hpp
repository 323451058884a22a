#pragma once

#include "isoboot/device_validator.hpp"
#include "isoboot/image_acquirer.hpp"
#include "isoboot/privilege_gate.hpp"
#include "isoboot/prompt.hpp"
#include "isoboot/session.hpp"
#include "system/system_ops.hpp"
#include "util/config.hpp"

#include <cstdint>
#include <vector>

namespace isoboot {

enum class State {
    Start,
    ShowLayout,
    Unmount,
    SelectTarget,
    SelectImage,
    ConfirmWrite,
    Write,
    Sync,
    OfferEject,
    Done,
};

enum class OrchestratorOutcome {
    Completed,
    Cancelled,   // operator typed exit (or stdin closed)
    Declined,    // operator answered no to the format confirmation
    WriteFailed,
    EjectFailed,
};

const char* ToString(State s);
const char* ToString(OrchestratorOutcome o);
// 0 for Completed/Cancelled/Declined, 1 for the fatal outcomes.
int ExitCodeFor(OrchestratorOutcome o);

struct WriteSettings {
    WriteBackend backend = WriteBackend::Dd; // resolved, never Auto
    std::uint64_t block_size_bytes = 4 * 1024 * 1024ULL;
    std::uint64_t fsync_interval_bytes = 64 * 1024 * 1024ULL;
};

// Drives one session through
//   Start -> ShowLayout -> Unmount -> SelectTarget -> SelectImage ->
//   ConfirmWrite -> Write -> Sync -> OfferEject -> Done
// States are entered strictly in order; the only loops are the re-prompts
// inside SelectTarget and SelectImage. Nothing irreversible happens before
// ConfirmWrite has been answered with yes.
class WriteOrchestrator {
public:
    WriteOrchestrator(Prompter& prompter,
                      const ISystemOps& ops,
                      const DeviceValidator& validator,
                      const ImageAcquirer& acquirer,
                      const PrivilegeGate& gate,
                      WriteSettings settings);

    // |session| must be fresh (no target, no image).
    OrchestratorOutcome Run(Session& session);

    State CurrentState() const { return state_; }
    // Every state entered during Run, in order.
    const std::vector<State>& Trace() const { return trace_; }

private:
    enum class Step { Advance, Cancelled, Declined, Failed };

    Step ShowLayout(Session& session);
    Step Unmount(Session& session);
    Step SelectTarget(Session& session);
    Step SelectImage(Session& session);
    Step ConfirmWrite(Session& session);
    Step Write(Session& session);
    Step Sync(Session& session);
    Step OfferEject(Session& session);

    void Enter(State s);
    OrchestratorOutcome Finish(Step step) const;

    Prompter& prompter_;
    const ISystemOps& ops_;
    const DeviceValidator& validator_;
    const ImageAcquirer& acquirer_;
    const PrivilegeGate& gate_;
    WriteSettings settings_;

    State state_ = State::Start;
    std::vector<State> trace_;
};

} // namespace isoboot
