#include "isoboot/image_acquirer.hpp"

#include "util/logger.hpp"
#include "util/text_utils.hpp"

#include <filesystem>
#include <ostream>

namespace fs = std::filesystem;

namespace isoboot {

const char* ToString(ImageRejection r) {
    switch (r) {
        case ImageRejection::NetworkError:   return "NetworkError";
        case ImageRejection::FileMissing:    return "FileMissing";
        case ImageRejection::WrongExtension: return "WrongExtension";
    }
    return "Unknown";
}

std::string DescribeRejection(ImageRejection r, std::string_view extension) {
    switch (r) {
        case ImageRejection::NetworkError:
            return "Error: Failed to download ISO file.";
        case ImageRejection::FileMissing:
            return "Error: File does not exist";
        case ImageRejection::WrongExtension:
            return "Error: File does not have " + std::string(extension) + " extension";
    }
    return "Error: Invalid ISO file.";
}

ImageAcquirer::ImageAcquirer(const ISystemOps& ops, ImageRules rules, std::ostream& notices, EnvLookup env)
    : ops_(ops), rules_(std::move(rules)), notices_(notices), env_(env ? std::move(env) : ProcessEnvironment()),
      download_dir_(ExpandUserPath(rules_.download_dir, env_)) {}

std::expected<ValidatedImage, ImageRejection> ImageAcquirer::ResolveImage(std::string_view input) const {
    if (IsHttpUrl(input)) {
        auto downloaded = Download(input);
        if (!downloaded) return std::unexpected(downloaded.error());
        return Validate(*downloaded);
    }

    return Validate(ExpandUserPath(input, env_));
}

std::optional<std::string> ImageAcquirer::DownloadDestination(std::string_view url) const {
    auto name = UrlFileName(url);
    if (!name) return std::nullopt;
    return (fs::path(download_dir_) / *name).string();
}

std::expected<std::string, ImageRejection> ImageAcquirer::Download(std::string_view url) const {
    auto dest = DownloadDestination(url);
    if (!dest) {
        notices_ << "Error: Cannot derive a file name from " << url << "\n";
        return std::unexpected(ImageRejection::NetworkError);
    }

    std::error_code ec;
    fs::create_directories(download_dir_, ec);
    if (ec) {
        notices_ << "Error: Cannot create " << download_dir_ << ": " << ec.message() << "\n";
        return std::unexpected(ImageRejection::NetworkError);
    }

    notices_ << "Downloading ISO to " << *dest << "...\n"
             << "This may take a while depending on your internet connection...\n"
             << std::flush;

    auto res = ops_.Download(url, *dest);
    if (!res.is_ok()) {
        LogWarn("download of %.*s failed: %s", (int)url.size(), url.data(), res.msg.c_str());
        notices_ << "Error downloading ISO\n";
        return std::unexpected(ImageRejection::NetworkError);
    }

    notices_ << "Download completed successfully\n";
    return *dest;
}

std::expected<ValidatedImage, ImageRejection> ImageAcquirer::Validate(const std::string& path) const {
    notices_ << "Checking ISO file: " << path << "\n";

    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec)) {
        notices_ << DescribeRejection(ImageRejection::FileMissing, rules_.extension) << "\n";
        return std::unexpected(ImageRejection::FileMissing);
    }

    if (!HasSuffix(path, rules_.extension)) {
        notices_ << DescribeRejection(ImageRejection::WrongExtension, rules_.extension) << "\n";
        return std::unexpected(ImageRejection::WrongExtension);
    }

    notices_ << "ISO file validation successful\n";
    LogInfo("Image accepted: %s", path.c_str());
    return ValidatedImage(path);
}

} // namespace isoboot
