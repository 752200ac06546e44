#pragma once
#include <string>
#include <map>
#include <chrono>

#include "artifact.hpp"
#include "structs.hpp"
#include "utils.hpp"

extern char** environ;

namespace crossforge {

struct GitInfo {
    std::string current_tag;
    std::string commit;
    std::string short_commit;
};

// Process-wide state for one run. Only the artifact registry is mutated after
// construction.
struct Context {
    Project config;
    std::string version;
    GitInfo git;
    std::map<std::string, std::string> env;
    std::chrono::system_clock::time_point date = std::chrono::system_clock::now();
    ArtifactRegistry artifacts;

    Context() = default;
    explicit Context(Project project) : config(std::move(project)) {
        env = process_env();
        for (const auto& entry : config.env) {
            auto [key, value] = Strings::split_env(entry);
            env[key] = value;
        }
    }

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    static std::map<std::string, std::string> process_env() {
        std::map<std::string, std::string> result;
        for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
            auto [key, value] = Strings::split_env(*e);
            result.emplace(std::move(key), std::move(value));
        }
        return result;
    }
};

} // namespace crossforge
