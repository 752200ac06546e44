#include "crossforge/manifest.hpp"
#include "fake_compiler.hpp"
#include <gtest/gtest.h>
#include <fstream>

using namespace crossforge;
using namespace crossforge::test_support;

class ManifestTest : public TempDirTest {
protected:
    static auto make_artifact(const std::string& path) -> Artifact {
        Artifact artifact;
        artifact.name = "foo";
        artifact.path = path;
        artifact.goos = "linux";
        artifact.goarch = "arm";
        artifact.goarm = "7";
        artifact.extra = {{"Binary", "foo"}, {"ID", "foo"}, {"Ext", ""}};
        return artifact;
    }
};

TEST_F(ManifestTest, HashFile) {
    write_file("empty", "");
    write_file("a", "hello");
    write_file("b", "hello!");

    EXPECT_EQ(Manifest::hash_file("empty"), "ef46db3751d8e999");
    EXPECT_EQ(Manifest::hash_file("a").size(), 16u);
    EXPECT_EQ(Manifest::hash_file("a"), Manifest::hash_file("a"));
    EXPECT_NE(Manifest::hash_file("a"), Manifest::hash_file("b"));
    EXPECT_EQ(Manifest::hash_file("missing"), "");
}

TEST_F(ManifestTest, ArtifactToJson) {
    write_file("dist/foo", "binary");
    const auto json = Manifest::to_json(make_artifact("dist/foo"));
    EXPECT_EQ(json.at("name").get<std::string>(), "foo");
    EXPECT_EQ(json.at("path").get<std::string>(), "dist/foo");
    EXPECT_EQ(json.at("goos").get<std::string>(), "linux");
    EXPECT_EQ(json.at("goarch").get<std::string>(), "arm");
    EXPECT_EQ(json.at("goarm").get<std::string>(), "7");
    EXPECT_EQ(json.at("type").get<std::string>(), "Binary");
    EXPECT_EQ(json.at("extra").at("ID").get<std::string>(), "foo");
    EXPECT_EQ(json.at("digest").get<std::string>(), Manifest::hash_file("dist/foo"));

    EXPECT_EQ(Manifest::to_json(make_artifact("dist/missing")).at("digest").get<std::string>(), "");
}

TEST_F(ManifestTest, WritesArtifactsJson) {
    const auto path = Manifest::write("out", {make_artifact("a"), make_artifact("b")});
    EXPECT_EQ(path.string(), (fs::path("out") / MANIFEST_FILE_NAME).string());

    std::ifstream file(path);
    const auto json = nlohmann::json::parse(file);
    ASSERT_TRUE(json.is_array());
    ASSERT_EQ(json.size(), 2u);
    EXPECT_EQ(json[0].at("path").get<std::string>(), "a");
    EXPECT_EQ(json[1].at("path").get<std::string>(), "b");
}
