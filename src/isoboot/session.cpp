#include "isoboot/session.hpp"

namespace isoboot {

Result Session::AssignTarget(const DeviceCandidate& candidate) {
    if (target_device_) {
        return Result::Fail(ErrorKind::ValidationRejected, -1,
                            "target device already set to " + *target_device_);
    }
    target_device_ = candidate.Path();
    return Result::Ok();
}

Result Session::AssignImage(const ValidatedImage& image) {
    if (image_path_) {
        return Result::Fail(ErrorKind::ValidationRejected, -1, "image already set to " + *image_path_);
    }
    image_path_ = image.Path();
    return Result::Ok();
}

} // namespace isoboot
