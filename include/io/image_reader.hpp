#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace isoboot {

// Sequential reader over a regular image file.
class ImageReader final : public IReader {
public:
    static Result Open(std::string path, ImageReader& out);

    std::optional<std::uint64_t> TotalSize() const override { return size_; }
    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

} // namespace isoboot
