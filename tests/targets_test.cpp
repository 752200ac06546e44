#include "crossforge/targets.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace crossforge;

class TargetMatrixTest : public ::testing::Test {
protected:
    static auto sorted(std::vector<std::string> v) -> std::vector<std::string> {
        std::ranges::sort(v);
        return v;
    }
};

TEST_F(TargetMatrixTest, EmptyListsExpandToDefaultMatrix) {
    const auto build = TargetMatrix::with_defaults(BuildConfig{});
    EXPECT_EQ(build.targets,
              (std::vector<std::string>{"linux_amd64", "linux_386", "darwin_amd64", "darwin_386"}));
}

TEST_F(TargetMatrixTest, DefaultsFillEveryEmptyField) {
    const auto build = TargetMatrix::with_defaults(BuildConfig{});
    EXPECT_EQ(build.main, ".");
    EXPECT_EQ(build.goos, (std::vector<std::string>{"linux", "darwin"}));
    EXPECT_EQ(build.goarch, (std::vector<std::string>{"amd64", "386"}));
    EXPECT_EQ(build.goarm, (std::vector<std::string>{"6"}));
    ASSERT_EQ(build.ldflags.size(), 1u);
    EXPECT_EQ(build.ldflags[0], DEFAULT_LDFLAGS);
}

TEST_F(TargetMatrixTest, IncompatiblePairsAreDropped) {
    BuildConfig config;
    config.goos = {"linux", "windows", "darwin"};
    config.goarch = {"amd64", "arm"};
    config.goarm = {"6"};
    const auto build = TargetMatrix::with_defaults(config);
    EXPECT_EQ(sorted(build.targets),
              sorted({"linux_amd64", "darwin_amd64", "windows_amd64", "linux_arm_6"}));
}

TEST_F(TargetMatrixTest, UnknownArmVariantsAreDropped) {
    BuildConfig config;
    config.goos = {"linux"};
    config.goarch = {"arm"};
    config.goarm = {"6", "8", "7"};
    const auto build = TargetMatrix::with_defaults(config);
    EXPECT_EQ(build.targets, (std::vector<std::string>{"linux_arm_6", "linux_arm_7"}));
}

TEST_F(TargetMatrixTest, DuplicatesAreRemovedKeepingFirstOccurrence) {
    BuildConfig config;
    config.goos = {"linux", "linux", "freebsd"};
    config.goarch = {"amd64", "amd64"};
    const auto build = TargetMatrix::with_defaults(config);
    EXPECT_EQ(build.targets, (std::vector<std::string>{"linux_amd64", "freebsd_amd64"}));
}

TEST_F(TargetMatrixTest, DefaultingIsIdempotent) {
    BuildConfig config;
    config.goos = {"linux", "windows"};
    config.goarch = {"amd64", "arm64"};
    const auto once = TargetMatrix::with_defaults(config);
    const auto twice = TargetMatrix::with_defaults(once);
    EXPECT_EQ(once.targets, twice.targets);
    EXPECT_EQ(once.goos, twice.goos);
    EXPECT_EQ(once.ldflags, twice.ldflags);
}

TEST_F(TargetMatrixTest, ExplicitTargetsAreKept) {
    BuildConfig config;
    config.targets = {"plan9_386", "linux"};
    const auto build = TargetMatrix::with_defaults(config);
    EXPECT_EQ(build.targets, (std::vector<std::string>{"plan9_386", "linux"}));
}

TEST_F(TargetMatrixTest, ExplicitTargetsAreDeduplicated) {
    BuildConfig config;
    config.targets = {"linux_amd64", "darwin_amd64", "linux_amd64", "darwin_amd64"};
    const auto once = TargetMatrix::with_defaults(config);
    EXPECT_EQ(once.targets, (std::vector<std::string>{"linux_amd64", "darwin_amd64"}));
    EXPECT_EQ(TargetMatrix::with_defaults(once).targets, once.targets);
}

TEST_F(TargetMatrixTest, InputIsNotMutated) {
    BuildConfig config;
    config.id = "foo";
    const auto build = TargetMatrix::with_defaults(config);
    EXPECT_FALSE(build.targets.empty());
    EXPECT_TRUE(config.targets.empty());
    EXPECT_TRUE(config.goos.empty());
    EXPECT_TRUE(config.main.empty());
}

TEST_F(TargetMatrixTest, ParseAcceptsValidIdentifiers) {
    const auto amd64 = TargetMatrix::parse("linux_amd64");
    ASSERT_TRUE(amd64.has_value());
    EXPECT_EQ(amd64->os, "linux");
    EXPECT_EQ(amd64->arch, "amd64");
    EXPECT_EQ(amd64->arm, "");

    const auto arm = TargetMatrix::parse("linux_arm_7");
    ASSERT_TRUE(arm.has_value());
    EXPECT_EQ(arm->arch, "arm");
    EXPECT_EQ(arm->arm, "7");
    EXPECT_EQ(arm->str(), "linux_arm_7");

    EXPECT_TRUE(TargetMatrix::parse("js_wasm").has_value());
}

TEST_F(TargetMatrixTest, ParseRejectsInvalidIdentifiers) {
    EXPECT_FALSE(TargetMatrix::parse("linux").has_value());
    EXPECT_FALSE(TargetMatrix::parse("").has_value());
    EXPECT_FALSE(TargetMatrix::parse("linux_amd64_6").has_value());
    EXPECT_FALSE(TargetMatrix::parse("darwin_arm_6").has_value());
    EXPECT_FALSE(TargetMatrix::parse("linux_arm_9").has_value());
    EXPECT_FALSE(TargetMatrix::parse("linux_arm_").has_value());
    EXPECT_FALSE(TargetMatrix::parse("windows_arm64").has_value());
    EXPECT_FALSE(TargetMatrix::parse("a_b_c_d").has_value());
}

TEST_F(TargetMatrixTest, InvalidTargetMessage) {
    EXPECT_EQ(TargetMatrix::invalid_target_message("linux"), "linux is not a valid build target");
}

TEST_F(TargetMatrixTest, TargetEnvironment) {
    const BuildTarget target{"linux", "arm", "7"};
    EXPECT_EQ(target.env(), (std::vector<std::string>{"GOOS=linux", "GOARCH=arm", "GOARM=7"}));

    const BuildTarget plain{"darwin", "amd64", ""};
    EXPECT_EQ(plain.env(), (std::vector<std::string>{"GOOS=darwin", "GOARCH=amd64", "GOARM="}));
}
