#include "crossforge/builder.hpp"
#include "fake_compiler.hpp"
#include <gtest/gtest.h>
#include <cerrno>
#include <system_error>
#include <thread>

using namespace crossforge;
using namespace crossforge::test_support;

class BuilderTest : public TempDirTest {
protected:
    FakeCompiler compiler_;
    Context ctx_;

    void SetUp() override {
        TempDirTest::SetUp();
        ctx_.config.name = "proj";
        ctx_.version = "1.2.3";
        ctx_.git = GitInfo{"v1.2.3", "123", "12"};
    }

    static auto options_for(const std::string& target, const std::string& ext = "") -> BuildOptions {
        BuildOptions options;
        options.target = target;
        options.ext = ext;
        options.name = "foo" + ext;
        options.path = "dist/foo_" + target + "/foo" + ext;
        return options;
    }

    static auto foo_build() -> BuildConfig {
        BuildConfig build;
        build.id = "foo";
        build.binary = "foo";
        return build;
    }

    auto build(const BuildConfig& config, const BuildOptions& options) -> std::optional<BuildError> {
        const Builder builder(compiler_);
        return builder.build(ctx_, config, options);
    }
};

TEST_F(BuilderTest, BuildsEveryTargetAndRecordsArtifacts) {
    write_good_main();
    const std::vector<std::pair<std::string, std::string>> targets = {
        {"linux_amd64", ""}, {"darwin_amd64", ""}, {"windows_amd64", ".exe"},
        {"linux_arm_6", ""}, {"js_wasm", ".wasm"},
    };

    for (const auto& [target, ext] : targets) {
        const auto error = build(foo_build(), options_for(target, ext));
        EXPECT_FALSE(error.has_value()) << target << ": " << (error ? error->message : "");
    }

    const auto artifacts = ctx_.artifacts.list();
    ASSERT_EQ(artifacts.size(), targets.size());
    for (size_t i = 0; i < targets.size(); ++i) {
        const auto& [target, ext] = targets[i];
        const auto parsed = TargetMatrix::parse(target);
        ASSERT_TRUE(parsed.has_value());
        const Artifact& artifact = artifacts[i];
        EXPECT_EQ(artifact.name, "foo" + ext);
        EXPECT_EQ(artifact.path, "dist/foo_" + target + "/foo" + ext);
        EXPECT_EQ(artifact.goos, parsed->os);
        EXPECT_EQ(artifact.goarch, parsed->arch);
        EXPECT_EQ(artifact.goarm, parsed->arm);
        EXPECT_EQ(artifact.type, ArtifactType::Binary);
        EXPECT_EQ(artifact.extra, (std::map<std::string, std::string>{{"Binary", "foo"}, {"ID", "foo"}, {"Ext", ext}}));
    }
    EXPECT_EQ(artifacts[3].goarm, "6");
    EXPECT_EQ(compiler_.invocations().size(), targets.size());
}

TEST_F(BuilderTest, InvocationCarriesRenderedFlagsAndEnvironment) {
    write_good_main();
    BuildConfig config = foo_build();
    config.flags = {"-v", "-tags={{.Os}}"};
    config.asmflags = {"asm1"};
    config.gcflags = {"gc1"};
    config.ldflags = {"-s -w", "-X main.version={{.Version}}"};
    config.env = {"CGO_ENABLED=0"};

    BuildOptions options = options_for("linux_arm_6");
    options.path = "dist/out";
    ASSERT_FALSE(build(config, options).has_value());

    const auto invocations = compiler_.invocations();
    ASSERT_EQ(invocations.size(), 1u);
    EXPECT_EQ(invocations[0].program, "go");
    EXPECT_EQ(invocations[0].args, (std::vector<std::string>{
        "build", "-v", "-tags=linux", "-asmflags=asm1", "-gcflags=gc1",
        "-ldflags=-s -w -X main.version=1.2.3", "-o", "dist/out", "."}));
    EXPECT_EQ(invocations[0].env, (std::vector<std::string>{
        "CGO_ENABLED=0", "GOOS=linux", "GOARCH=arm", "GOARM=6"}));
}

TEST_F(BuilderTest, InvalidTargetFailsBeforeInvocation) {
    write_good_main();
    const auto error = build(foo_build(), options_for("linux"));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::InvalidTarget);
    EXPECT_EQ(error->message, "linux is not a valid build target");
    EXPECT_TRUE(compiler_.invocations().empty());
    EXPECT_EQ(ctx_.artifacts.size(), 0u);
}

TEST_F(BuilderTest, TemplateErrorsAreReportedVerbatim) {
    write_good_main();
    BuildConfig config = foo_build();
    config.ldflags = {"-s -w -X main.version={{.Version}"};
    auto error = build(config, options_for("linux_amd64"));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::TemplateError);
    EXPECT_EQ(error->message, R"(template: tmpl:1: unexpected "}" in operand)");

    config = foo_build();
    config.flags = {"-X main.foo={{.Env.NOPE}}"};
    error = build(config, options_for("linux_amd64"));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::TemplateError);
    EXPECT_EQ(error->message,
              R"(template: tmpl:1:18: executing "tmpl" at <.Env.NOPE>: map has no entry for key "NOPE")");

    EXPECT_TRUE(compiler_.invocations().empty());
    EXPECT_EQ(ctx_.artifacts.size(), 0u);
}

TEST_F(BuilderTest, ToolchainFailureCarriesDiagnostic) {
    write_good_main();
    compiler_.result = {2, "", "main.go:3: undefined: x"};
    auto error = build(foo_build(), options_for("linux_amd64"));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::ToolchainFailure);
    EXPECT_EQ(error->message, "failed to build for linux_amd64: main.go:3: undefined: x");

    compiler_.result = {1, "only stdout", ""};
    error = build(foo_build(), options_for("darwin_amd64"));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->message, "failed to build for darwin_amd64: only stdout");

    EXPECT_EQ(ctx_.artifacts.size(), 0u);
}

TEST_F(BuilderTest, MissingMainFunction) {
    write_main_without_main_func();
    BuildConfig config;
    config.binary = "no-main";

    for (const std::string entry : {"", ".", "main.go", "*.go"}) {
        config.main = entry;
        const auto error = build(config, options_for("linux_amd64"));
        ASSERT_TRUE(error.has_value()) << entry;
        EXPECT_EQ(error->kind, ErrorKind::MissingEntryPoint) << entry;
        EXPECT_EQ(error->message, "build for no-main does not contain a main function") << entry;
    }

    config.id = "my-id";
    config.main = ".";
    const auto error = build(config, options_for("linux_amd64"));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->message, "build for my-id does not contain a main function");

    EXPECT_TRUE(compiler_.invocations().empty());
    EXPECT_EQ(ctx_.artifacts.size(), 0u);
}

TEST_F(BuilderTest, MissingMainFileIsAStatError) {
    write_main_without_main_func();
    BuildConfig config;
    config.binary = "no-main";
    config.main = "foo.go";

    const auto error = build(config, options_for("linux_amd64"));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::FileResolutionError);
    EXPECT_EQ(error->message, "stat foo.go: " + std::generic_category().message(ENOENT));
}

TEST_F(BuilderTest, MainFunctionOutsideMainGo) {
    write_file("foo.go", "package main\nfunc main() {println(0)}");
    BuildConfig config;
    config.binary = "foo";

    for (const std::string entry : {"", "foo.go", ".", "f*.go"}) {
        config.main = entry;
        EXPECT_FALSE(build(config, options_for("linux_amd64")).has_value()) << entry;
    }
    EXPECT_EQ(ctx_.artifacts.size(), 4u);
}

TEST_F(BuilderTest, MainInCommentsOrMethodsDoesNotCount) {
    write_file("main.go",
               "package main\n"
               "// func main() {}\n"
               "/*\nfunc main() {}\n*/\n"
               "type S struct{}\n"
               "func (s S) main() {}\n"
               "var x = \"func main() {}\"\n");
    const auto error = build(foo_build(), options_for("linux_amd64"));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::MissingEntryPoint);
}

TEST_F(BuilderTest, RuneLiteralsDoNotHideMain) {
    write_file("main.go",
               "package main\n"
               "var q = '\"'\n"
               "var e = '\\''\n"
               "func main() { println(\"x\") }\n");
    EXPECT_FALSE(build(foo_build(), options_for("linux_amd64")).has_value());
    EXPECT_EQ(ctx_.artifacts.size(), 1u);
}

TEST_F(BuilderTest, WildcardInDirectoryIsRejected) {
    write_file("cmd/foo/main.go", "package main\nfunc main() {}\n");
    BuildConfig config = foo_build();
    config.main = "cmd/*/main.go";

    const auto error = build(config, options_for("linux_amd64"));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::FileResolutionError);
    EXPECT_EQ(error->message, "main cmd/*/main.go: wildcards are only allowed in the file name");
    EXPECT_TRUE(compiler_.invocations().empty());
}

TEST_F(BuilderTest, MainInSubdirectory) {
    write_file("cmd/foo/main.go", "package main\n\nfunc main() {\n}\n");
    BuildConfig config = foo_build();
    config.main = "./cmd/foo";
    ASSERT_FALSE(build(config, options_for("linux_amd64")).has_value());
    EXPECT_EQ(compiler_.invocations()[0].args.back(), "./cmd/foo");
}

TEST_F(BuilderTest, BinaryNameIsRendered) {
    write_good_main();
    BuildConfig config = foo_build();
    config.binary = "foo-{{.Os}}-{{.Arch}}";
    ASSERT_FALSE(build(config, options_for("freebsd_386")).has_value());
    EXPECT_EQ(ctx_.artifacts.list()[0].extra.at("Binary"), "foo-freebsd-386");
}

TEST_F(BuilderTest, ConcurrentBuildsShareTheRegistry) {
    write_good_main();
    const std::vector<std::string> targets = {
        "linux_amd64", "linux_386", "darwin_amd64", "openbsd_arm_7", "windows_386",
    };

    std::vector<std::thread> workers;
    for (const auto& target : targets) {
        workers.emplace_back([this, target] {
            EXPECT_FALSE(build(foo_build(), options_for(target)).has_value());
        });
    }
    for (auto& worker : workers) worker.join();

    EXPECT_EQ(ctx_.artifacts.size(), targets.size());
}

TEST(ErrorKindTest, ToString) {
    EXPECT_STREQ(error_kind_to_string(ErrorKind::InvalidTarget), "InvalidTarget");
    EXPECT_STREQ(error_kind_to_string(ErrorKind::ToolchainFailure), "ToolchainFailure");
}
