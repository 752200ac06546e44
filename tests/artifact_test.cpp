#include "crossforge/artifact.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace crossforge;

namespace {

auto make_artifact(const std::string& name, const std::string& goos) -> Artifact {
    Artifact artifact;
    artifact.name = name;
    artifact.path = "dist/" + name;
    artifact.goos = goos;
    artifact.goarch = "amd64";
    artifact.extra = {{"Binary", name}, {"ID", "foo"}, {"Ext", ""}};
    return artifact;
}

} // namespace

TEST(ArtifactRegistryTest, KeepsInsertionOrder) {
    ArtifactRegistry registry;
    registry.add(make_artifact("a", "linux"));
    registry.add(make_artifact("b", "darwin"));
    registry.add(make_artifact("a", "linux"));

    const auto items = registry.list();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].name, "a");
    EXPECT_EQ(items[1].name, "b");
    EXPECT_EQ(items[2], items[0]);
}

TEST(ArtifactRegistryTest, ListIsASnapshot) {
    ArtifactRegistry registry;
    registry.add(make_artifact("a", "linux"));
    const auto snapshot = registry.list();
    registry.add(make_artifact("b", "linux"));
    EXPECT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(registry.size(), 2u);
}

TEST(ArtifactRegistryTest, Filter) {
    ArtifactRegistry registry;
    registry.add(make_artifact("a", "linux"));
    registry.add(make_artifact("b", "darwin"));
    registry.add(make_artifact("c", "linux"));

    const auto on_linux = registry.filter([](const Artifact& a) { return a.goos == "linux"; });
    ASSERT_EQ(on_linux.size(), 2u);
    EXPECT_EQ(on_linux[0].name, "a");
    EXPECT_EQ(on_linux[1].name, "c");
}

TEST(ArtifactRegistryTest, ConcurrentAdds) {
    ArtifactRegistry registry;
    constexpr int threads = 8;
    constexpr int per_thread = 100;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&registry, t] {
            for (int i = 0; i < per_thread; ++i) {
                registry.add(make_artifact(std::to_string(t) + "_" + std::to_string(i), "linux"));
            }
        });
    }
    for (auto& worker : workers) worker.join();

    EXPECT_EQ(registry.size(), static_cast<size_t>(threads * per_thread));
}

TEST(ArtifactTypeTest, ToString) {
    EXPECT_STREQ(artifact_type_to_string(ArtifactType::Binary), "Binary");
}
