#pragma once

#include "system/system_ops.hpp"
#include "util/path_utils.hpp"

#include <expected>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace isoboot {

enum class ImageRejection {
    NetworkError,
    FileMissing,
    WrongExtension,
};

const char* ToString(ImageRejection r);
std::string DescribeRejection(ImageRejection r, std::string_view extension);

// An image path that exists, is a regular file and carries the image
// extension. Only ImageAcquirer can make one.
class ValidatedImage {
public:
    const std::string& Path() const { return path_; }

private:
    friend class ImageAcquirer;
    explicit ValidatedImage(std::string path) : path_(std::move(path)) {}

    std::string path_;
};

struct ImageRules {
    std::string extension = ".iso";
    // Expanded with ExpandUserPath before use.
    std::string download_dir = "~/Downloads";
};

class ImageAcquirer {
public:
    // |notices| receives the operator-facing download/validation messages.
    ImageAcquirer(const ISystemOps& ops, ImageRules rules, std::ostream& notices, EnvLookup env = ProcessEnvironment());

    // URLs are downloaded first, anything else is expanded as a local path;
    // the result is validated either way.
    std::expected<ValidatedImage, ImageRejection> ResolveImage(std::string_view input) const;

    // Path the download of |url| lands on, nullopt when the URL carries no
    // file name.
    std::optional<std::string> DownloadDestination(std::string_view url) const;

    std::expected<std::string, ImageRejection> Download(std::string_view url) const;
    std::expected<ValidatedImage, ImageRejection> Validate(const std::string& path) const;

    const std::string& DownloadDir() const { return download_dir_; }
    const std::string& Extension() const { return rules_.extension; }

private:
    const ISystemOps& ops_;
    ImageRules rules_;
    std::ostream& notices_;
    EnvLookup env_;
    std::string download_dir_;
};

} // namespace isoboot
