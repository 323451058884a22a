#pragma once

#include "system/system_ops.hpp"

#include <expected>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace isoboot {

enum class DeviceRejection {
    NotABlockDevice,
    SystemDiskProtected,
    DeviceMounted,
};

const char* ToString(DeviceRejection r);
// Operator-facing explanation, printed before re-prompting.
std::string DescribeRejection(DeviceRejection r, std::string_view path);

// A device path that passed every safety check. Only DeviceValidator can
// make one, so a raw operator string can never be used as a write target.
class DeviceCandidate {
public:
    const std::string& Path() const { return path_; }

private:
    friend class DeviceValidator;
    explicit DeviceCandidate(std::string path) : path_(std::move(path)) {}

    std::string path_;
};

struct DeviceRules {
    std::string system_disk = "/dev/sda";
    std::string device_pattern = "^/dev/sd[a-z]$";
};

// True when |source| is |device| itself or one of its partitions
// (/dev/sdb1, /dev/nvme0n1p2, /dev/mmcblk0p1).
bool MountSourceBelongsTo(std::string_view source, std::string_view device);

class DeviceValidator {
public:
    // |rules.device_pattern| must be a valid ECMAScript regex; Config
    // validates it at load time.
    DeviceValidator(const ISystemOps& ops, DeviceRules rules);

    // Lines describing the current block devices. Empty when the listing
    // could not be produced; the failure is logged.
    std::vector<std::string> ListDevices() const;

    // Checks run in order and the first failure wins: naming pattern and
    // block-special file, then system disk, then live mount table.
    std::expected<DeviceCandidate, DeviceRejection> ValidateTarget(std::string_view candidate) const;

    const DeviceRules& Rules() const { return rules_; }

private:
    bool IsMounted(std::string_view candidate) const;

    const ISystemOps& ops_;
    DeviceRules rules_;
    std::regex pattern_;
};

} // namespace isoboot
