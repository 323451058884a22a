#pragma once

#include "isoboot/device_validator.hpp"
#include "isoboot/image_acquirer.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

namespace isoboot {

// State of one run of the tool. The target device and image path are
// write-once and can only be filled from validator output.
class Session {
public:
    const std::optional<std::string>& TargetDevice() const { return target_device_; }
    const std::optional<std::string>& ImagePath() const { return image_path_; }

    Result AssignTarget(const DeviceCandidate& candidate);
    Result AssignImage(const ValidatedImage& image);

    bool unmount_requested = false;
    bool confirmed = false;
    bool eject_requested = false;
    std::optional<std::string> unmounted_path;

private:
    std::optional<std::string> target_device_;
    std::optional<std::string> image_path_;
};

} // namespace isoboot
