#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>

namespace isoboot {

// Writes straight to a block device. Paths outside /dev are treated as
// plain files (created and truncated), which keeps the writer testable.
class DeviceWriter final : public IWriter {
  public:
    static Result Open(std::string path, DeviceWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result Flush() override;
    Result Close();

  private:
    std::string path_;
    Fd fd_;
};

} // namespace isoboot
