#include "isoboot/device_validator.hpp"

#include "util/logger.hpp"

#include <cctype>

namespace isoboot {

const char* ToString(DeviceRejection r) {
    switch (r) {
        case DeviceRejection::NotABlockDevice:     return "NotABlockDevice";
        case DeviceRejection::SystemDiskProtected: return "SystemDiskProtected";
        case DeviceRejection::DeviceMounted:       return "DeviceMounted";
    }
    return "Unknown";
}

std::string DescribeRejection(DeviceRejection r, std::string_view path) {
    switch (r) {
        case DeviceRejection::NotABlockDevice:
            return "Error: Invalid disk format or device does not exist: '" + std::string(path) +
                   "'. Please enter /dev/sdX (e.g., /dev/sdb).";
        case DeviceRejection::SystemDiskProtected:
            return "Error: Cannot use system disk as target.";
        case DeviceRejection::DeviceMounted:
            return "Error: Target disk is mounted. Please unmount it first.";
    }
    return "Error: Invalid target disk.";
}

bool MountSourceBelongsTo(std::string_view source, std::string_view device) {
    if (device.empty() || source.rfind(device, 0) != 0) return false;

    std::string_view rest = source.substr(device.size());
    if (rest.empty()) return true;
    if (rest.front() == 'p') rest.remove_prefix(1);
    if (rest.empty()) return false;
    for (char c : rest) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

DeviceValidator::DeviceValidator(const ISystemOps& ops, DeviceRules rules)
    : ops_(ops), rules_(std::move(rules)), pattern_(rules_.device_pattern, std::regex::ECMAScript) {}

std::vector<std::string> DeviceValidator::ListDevices() const {
    std::vector<std::string> lines;
    auto res = ops_.ListBlockDevices(lines);
    if (!res.is_ok()) {
        LogWarn("Cannot list block devices: %s", res.msg.c_str());
        return {};
    }
    return lines;
}

std::expected<DeviceCandidate, DeviceRejection> DeviceValidator::ValidateTarget(std::string_view candidate) const {
    const std::string path(candidate);

    if (!std::regex_match(path, pattern_) || !ops_.IsBlockDevice(path)) {
        LogDebug("reject %s: %s", path.c_str(), ToString(DeviceRejection::NotABlockDevice));
        return std::unexpected(DeviceRejection::NotABlockDevice);
    }

    if (path == rules_.system_disk) {
        LogDebug("reject %s: %s", path.c_str(), ToString(DeviceRejection::SystemDiskProtected));
        return std::unexpected(DeviceRejection::SystemDiskProtected);
    }

    if (IsMounted(path)) {
        LogDebug("reject %s: %s", path.c_str(), ToString(DeviceRejection::DeviceMounted));
        return std::unexpected(DeviceRejection::DeviceMounted);
    }

    LogInfo("Target device accepted: %s", path.c_str());
    return DeviceCandidate(path);
}

bool DeviceValidator::IsMounted(std::string_view candidate) const {
    std::vector<std::string> sources;
    auto res = ops_.ReadMountSources(sources);
    if (!res.is_ok()) {
        // Without a mount table nothing proves the device is idle.
        LogWarn("%s; treating %.*s as mounted",
                res.msg.c_str(),
                (int)candidate.size(),
                candidate.data());
        return true;
    }

    for (const auto& source : sources) {
        if (MountSourceBelongsTo(source, candidate)) return true;
    }
    return false;
}

} // namespace isoboot
