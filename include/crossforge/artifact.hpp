#pragma once
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <functional>

namespace crossforge {

enum class ArtifactType {
    Binary,
};

inline const char* artifact_type_to_string(const ArtifactType type) {
    switch (type) {
        case ArtifactType::Binary: return "Binary";
    }
    return "Unknown";
}

// One produced file. Extra always carries "Binary", "ID" and "Ext" for binaries.
struct Artifact {
    std::string name;
    std::string path;
    std::string goos;
    std::string goarch;
    std::string goarm;
    ArtifactType type = ArtifactType::Binary;
    std::map<std::string, std::string> extra;

    bool operator==(const Artifact&) const = default;
};

// Append-only, insertion-ordered, safe for concurrent add() from worker threads.
class ArtifactRegistry {
public:
    ArtifactRegistry() = default;
    ArtifactRegistry(const ArtifactRegistry&) = delete;
    ArtifactRegistry& operator=(const ArtifactRegistry&) = delete;

    void add(Artifact artifact) {
        std::lock_guard lock(mutex_);
        items_.push_back(std::move(artifact));
    }

    // Snapshot copy; later add() calls do not affect it
    std::vector<Artifact> list() const {
        std::lock_guard lock(mutex_);
        return items_;
    }

    std::vector<Artifact> filter(const std::function<bool(const Artifact&)>& pred) const {
        std::lock_guard lock(mutex_);
        std::vector<Artifact> result;
        for (const auto& a : items_) {
            if (pred(a)) result.push_back(a);
        }
        return result;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Artifact> items_;
};

} // namespace crossforge
