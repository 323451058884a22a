#include <gtest/gtest.h>

#include "isoboot/image_acquirer.hpp"
#include "testing.hpp"

#include <filesystem>
#include <sstream>

namespace {

class ImageAcquirerTest : public ::testing::Test {
  protected:
    // HOME points at the temporary directory, so "~/Downloads" lands there.
    isoboot::ImageAcquirer Make(isoboot::ImageRules rules = {}) {
        return isoboot::ImageAcquirer(ops, std::move(rules), notices,
                                      testutil::MapEnv({{"HOME", tmp.Path()}, {"ISOS", tmp.Join("isos")}}));
    }

    testutil::TemporaryDirectory tmp;
    testutil::FakeSystemOps ops;
    std::ostringstream notices;
};

} // namespace

TEST_F(ImageAcquirerTest, AcceptsExistingLocalImage) {
    testutil::WriteFile(tmp.Join("ubuntu.iso"), "iso");
    auto acq = Make();

    auto r = acq.ResolveImage(tmp.Join("ubuntu.iso"));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->Path(), tmp.Join("ubuntu.iso"));
    EXPECT_EQ(ops.Count("download"), 0);
    EXPECT_NE(notices.str().find("ISO file validation successful"), std::string::npos);
}

TEST_F(ImageAcquirerTest, ExpandsHomeAndVariablesInLocalPaths) {
    std::filesystem::create_directories(tmp.Join("isos"));
    testutil::WriteFile(tmp.Join("isos/a.iso"), "iso");
    auto acq = Make();

    auto by_tilde = acq.ResolveImage("~/isos/a.iso");
    ASSERT_TRUE(by_tilde.has_value());
    EXPECT_EQ(by_tilde->Path(), tmp.Join("isos/a.iso"));

    auto by_var = acq.ResolveImage("${ISOS}/a.iso");
    ASSERT_TRUE(by_var.has_value());
    EXPECT_EQ(by_var->Path(), tmp.Join("isos/a.iso"));
}

TEST_F(ImageAcquirerTest, MissingFileIsRejected) {
    auto acq = Make();
    auto r = acq.ResolveImage(tmp.Join("missing.iso"));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), isoboot::ImageRejection::FileMissing);
    EXPECT_NE(notices.str().find("Error: File does not exist"), std::string::npos);
}

TEST_F(ImageAcquirerTest, DirectoryIsRejectedAsMissing) {
    std::filesystem::create_directories(tmp.Join("dir.iso"));
    auto acq = Make();
    auto r = acq.ResolveImage(tmp.Join("dir.iso"));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), isoboot::ImageRejection::FileMissing);
}

TEST_F(ImageAcquirerTest, WrongExtensionIsRejected) {
    testutil::WriteFile(tmp.Join("image.img"), "img");
    testutil::WriteFile(tmp.Join("upper.ISO"), "iso");
    auto acq = Make();

    auto r = acq.ResolveImage(tmp.Join("image.img"));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), isoboot::ImageRejection::WrongExtension);
    EXPECT_NE(notices.str().find("Error: File does not have .iso extension"), std::string::npos);

    auto upper = acq.ResolveImage(tmp.Join("upper.ISO"));
    ASSERT_FALSE(upper.has_value());
    EXPECT_EQ(upper.error(), isoboot::ImageRejection::WrongExtension);
}

TEST_F(ImageAcquirerTest, ConfiguredExtensionIsHonoured) {
    testutil::WriteFile(tmp.Join("disk.img"), "img");
    isoboot::ImageRules rules;
    rules.extension = ".img";
    auto acq = Make(rules);
    EXPECT_TRUE(acq.ResolveImage(tmp.Join("disk.img")).has_value());
}

TEST_F(ImageAcquirerTest, UrlIsDownloadedIntoDownloadDirThenValidated) {
    auto acq = Make();
    auto r = acq.ResolveImage("https://example.com/releases/distro.iso?mirror=eu");
    ASSERT_TRUE(r.has_value());

    const std::string expected = tmp.Join("Downloads/distro.iso");
    EXPECT_EQ(r->Path(), expected);
    ASSERT_EQ(ops.downloads.size(), 1u);
    EXPECT_EQ(ops.downloads[0].first, "https://example.com/releases/distro.iso?mirror=eu");
    EXPECT_EQ(ops.downloads[0].second, expected);
    EXPECT_TRUE(std::filesystem::is_directory(tmp.Join("Downloads")));

    const std::string out = notices.str();
    EXPECT_NE(out.find("Downloading ISO to " + expected), std::string::npos);
    EXPECT_NE(out.find("Download completed successfully"), std::string::npos);
    EXPECT_LT(out.find("Download completed successfully"), out.find("Checking ISO file"));
}

TEST_F(ImageAcquirerTest, DownloadedFileStillNeedsTheExtension) {
    auto acq = Make();
    auto r = acq.ResolveImage("http://example.com/latest");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), isoboot::ImageRejection::WrongExtension);
    EXPECT_EQ(ops.Count("download"), 1);
}

TEST_F(ImageAcquirerTest, DownloadFailureIsNetworkError) {
    ops.download_result = testutil::ToolFailure(8, "wget");
    auto acq = Make();
    auto r = acq.ResolveImage("https://example.com/a.iso");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), isoboot::ImageRejection::NetworkError);
    EXPECT_NE(notices.str().find("Error downloading ISO"), std::string::npos);
    EXPECT_EQ(notices.str().find("Checking ISO file"), std::string::npos);
}

TEST_F(ImageAcquirerTest, UrlWithoutFileNameIsNotDownloaded) {
    auto acq = Make();
    auto r = acq.ResolveImage("https://example.com/");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), isoboot::ImageRejection::NetworkError);
    EXPECT_EQ(ops.Count("download"), 0);
}

TEST_F(ImageAcquirerTest, NonUrlNeverDownloads) {
    auto acq = Make();
    (void)acq.ResolveImage("ftp://example.com/a.iso");
    (void)acq.ResolveImage("example.com/a.iso");
    EXPECT_EQ(ops.Count("download"), 0);
}

TEST_F(ImageAcquirerTest, DownloadDirIsExpanded) {
    isoboot::ImageRules rules;
    rules.download_dir = "$ISOS/cache";
    auto acq = Make(rules);
    EXPECT_EQ(acq.DownloadDir(), tmp.Join("isos/cache"));
    EXPECT_EQ(acq.DownloadDestination("https://h/x.iso"), tmp.Join("isos/cache/x.iso"));
    EXPECT_FALSE(acq.DownloadDestination("https://h/").has_value());
}

TEST_F(ImageAcquirerTest, RepeatedValidationIsStable) {
    testutil::WriteFile(tmp.Join("a.iso"), "iso");
    auto acq = Make();
    for (int i = 0; i < 3; ++i) {
        auto r = acq.Validate(tmp.Join("a.iso"));
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(r->Path(), tmp.Join("a.iso"));
    }
}
