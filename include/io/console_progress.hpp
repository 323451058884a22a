#pragma once

#include "io/progress.hpp"

#include <cstdio>

namespace isoboot {

// Redraws a single "\r"-terminated status line on the given stream.
class ConsoleProgressSink final : public IProgress {
public:
    explicit ConsoleProgressSink(std::FILE* stream = stderr) : stream_(stream) {}

    void OnProgress(const ProgressEvent& e) override;

private:
    std::FILE* stream_;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace isoboot
