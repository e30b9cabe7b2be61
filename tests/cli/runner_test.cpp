// File: tests/cli/runner_test.cpp

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

#include "cli/runner.hpp"
#include "support/synthetic_images.hpp"

using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::StartsWith;
namespace support = tests::support;

class RunnerTest : public ::testing::Test {
protected:
    support::TemporaryDirectory directory;
    std::ostringstream out;
    std::ostringstream err;

    int run(const std::initializer_list<std::string> arguments, const batch::CancellationToken *token = nullptr) {
        const std::vector<std::string> storage(arguments);
        std::vector<const char *> argv{"image-similarity"};
        for (const auto &argument: storage) {
            argv.push_back(argument.c_str());
        }
        return cli::run(static_cast<int>(argv.size()), argv.data(), out, err, token);
    }

    std::string path(const std::string &name) const { return (directory.path() / name).string(); }
};

TEST_F(RunnerTest, HelpAndVersionExitZero) {
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_THAT(out.str(), HasSubstr("Usage:"));
    EXPECT_EQ(run({"--version"}), 0);
    EXPECT_THAT(out.str(), HasSubstr("image-similarity "));
    EXPECT_THAT(err.str(), IsEmpty());
}

TEST_F(RunnerTest, UsageErrorsExitTwoWithUsage) {
    EXPECT_EQ(run({}), 2);
    EXPECT_THAT(err.str(), HasSubstr("error: No command given"));
    EXPECT_THAT(err.str(), HasSubstr("Usage:"));
    EXPECT_THAT(out.str(), IsEmpty());

    EXPECT_EQ(run({"pair", "-a", "only-one.png"}), 2);
    EXPECT_EQ(run({"-m", "sift", "directory", "-d", directory.path().string()}), 2);
}

TEST_F(RunnerTest, InvalidValuesExitTwo) {
    EXPECT_EQ(run({"-f", "xml", "directory", "-d", directory.path().string()}), 2);
    EXPECT_EQ(run({"-L", "loud", "directory", "-d", directory.path().string()}), 2);

    const auto config = directory.writeText("bad.yaml", "descriptor:\n  hash_size: 7\n");
    EXPECT_EQ(run({"-c", config.string(), "directory", "-d", directory.path().string()}), 2);
}

TEST_F(RunnerTest, UnreadableConfigurationExitsOne) {
    EXPECT_EQ(run({"-c", path("missing.yaml"), "directory", "-d", directory.path().string()}), 1);
    EXPECT_THAT(err.str(), HasSubstr("error: "));
}

TEST_F(RunnerTest, PairPrintsOneScore) {
    directory.writeImage("a.png", support::ramp());
    directory.writeImage("b.png", support::ramp());

    EXPECT_EQ(run({"pair", "-a", path("a.png"), "-b", path("b.png")}), 0);
    EXPECT_EQ(out.str(), "1.000000 \"" + path("a.png") + "\" \"" + path("b.png") + "\"\n");
}

TEST_F(RunnerTest, PairWithUndecodableImageExitsOne) {
    directory.writeImage("a.png", support::ramp());
    directory.writeText("broken.png", "not an image");

    EXPECT_EQ(run({"pair", "-a", path("a.png"), "-b", path("broken.png")}), 1);
    EXPECT_THAT(err.str(), StartsWith("error: "));
    EXPECT_THAT(out.str(), IsEmpty());

    EXPECT_EQ(run({"pair", "-a", path("a.png"), "-b", path("absent.png")}), 1);
}

TEST_F(RunnerTest, DirectoryWithSkippedFilesStillSucceeds) {
    directory.writeImage("a.png", support::ramp());
    directory.writeImage("b.png", support::squareOnDark());
    directory.writeText("broken.png", "not an image");

    EXPECT_EQ(run({"directory", "-d", directory.path().string()}), 0);
    EXPECT_THAT(out.str(), HasSubstr("\"" + path("a.png") + "\" \"" + path("b.png") + "\"\n"));
    EXPECT_THAT(out.str(), HasSubstr("skipped \"" + path("broken.png") + "\": decode: "));
}

TEST_F(RunnerTest, MissingDirectoryExitsOne) {
    EXPECT_EQ(run({"directory", "-d", path("nowhere")}), 1);
    EXPECT_THAT(err.str(), HasSubstr(path("nowhere")));

    directory.writeImage("target.png", support::ramp());
    EXPECT_EQ(run({"match", "-i", path("target.png"), "-d", path("nowhere")}), 1);
}

TEST_F(RunnerTest, UndecodableMatchTargetExitsOne) {
    directory.writeImage("a.png", support::ramp());
    directory.writeText("target.png", "not an image");

    EXPECT_EQ(run({"match", "-i", path("target.png"), "-d", directory.path().string()}), 1);
}

TEST_F(RunnerTest, CancelledRunExitsZeroWithPartialReport) {
    directory.writeImage("a.png", support::ramp());
    directory.writeImage("b.png", support::squareOnDark());
    batch::CancellationToken token;
    token.cancel();

    EXPECT_EQ(run({"directory", "-d", directory.path().string()}, &token), 0);
    EXPECT_THAT(out.str(), HasSubstr("# cancelled, results are partial"));
}
