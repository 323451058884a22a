#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <sys/types.h>

namespace isoboot {

class IReader {
public:
    virtual ~IReader() = default;
    // Bytes read, 0 at end of input, -1 with errno set on failure.
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
};

class IWriter {
public:
    virtual ~IWriter() = default;
    virtual Result WriteAll(std::span<const std::uint8_t> in) = 0;
    // Durability flush: returns once written data reached the device.
    virtual Result Flush() = 0;
};

} // namespace isoboot
