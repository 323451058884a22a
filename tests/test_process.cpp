#include <gtest/gtest.h>

#include "system/process.hpp"
#include "testing.hpp"

#include <sys/stat.h>

TEST(ProcessTest, ReportsExitStatus) {
    int code = -1;
    ASSERT_TRUE(isoboot::RunProcess({"true"}, code).is_ok());
    EXPECT_EQ(code, 0);

    ASSERT_TRUE(isoboot::RunProcess({"false"}, code).is_ok());
    EXPECT_EQ(code, 1);
}

TEST(ProcessTest, CapturesStdoutLines) {
    std::vector<std::string> lines;
    int code = -1;
    ASSERT_TRUE(isoboot::RunProcessCapture({"printf", "one\ntwo words\n\nthree"}, lines, code).is_ok());
    EXPECT_EQ(code, 0);
    EXPECT_EQ(lines, (std::vector<std::string>{"one", "two words", "", "three"}));
}

TEST(ProcessTest, ArgumentsAreNotInterpretedByAShell) {
    std::vector<std::string> lines;
    int code = -1;
    ASSERT_TRUE(isoboot::RunProcessCapture({"echo", "$HOME; rm -rf /tmp/nothing"}, lines, code).is_ok());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "$HOME; rm -rf /tmp/nothing");
}

TEST(ProcessTest, MissingProgramExitsWithExecFailure) {
    int code = -1;
    ASSERT_TRUE(isoboot::RunProcess({"isoboot-no-such-program-xyz"}, code).is_ok());
    EXPECT_EQ(code, isoboot::kExecFailedExit);
}

TEST(ProcessTest, EmptyArgvIsRejected) {
    int code = -1;
    EXPECT_FALSE(isoboot::RunProcess({}, code).is_ok());
}

TEST(ProcessTest, FindExecutableSearchesPath) {
    testutil::TemporaryDirectory tmp;
    const std::string tool = tmp.Join("mytool");
    testutil::WriteFile(tool, "#!/bin/sh\nexit 0\n");
    ASSERT_EQ(::chmod(tool.c_str(), 0755), 0);
    testutil::WriteFile(tmp.Join("notexec"), "data");

    auto env = testutil::MapEnv({{"PATH", "/nonexistent:" + tmp.Path()}});
    EXPECT_EQ(isoboot::FindExecutable("mytool", env), tool);
    EXPECT_FALSE(isoboot::FindExecutable("notexec", env).has_value());
    EXPECT_FALSE(isoboot::FindExecutable("missingtool", env).has_value());
    EXPECT_EQ(isoboot::FindExecutable(tool, env), tool);
    EXPECT_FALSE(isoboot::FindExecutable(tmp.Join("notexec"), env).has_value());
}
