#pragma once
#include <string>
#include <vector>

namespace crossforge {

struct Hooks {
    std::string pre;
    std::string post;
};

struct BuildConfig {
    std::string id;
    std::string binary;
    std::string main;
    std::vector<std::string> goos;
    std::vector<std::string> goarch;
    std::vector<std::string> goarm;
    std::vector<std::string> targets;
    std::vector<std::string> flags;
    std::vector<std::string> asmflags;
    std::vector<std::string> gcflags;
    std::vector<std::string> ldflags;
    std::vector<std::string> env;
    Hooks hooks;
};

struct Project {
    std::string name;
    std::string dist = "dist";
    unsigned int parallelism = 0; // 0 = hardware concurrency
    std::vector<std::string> env;
    std::vector<BuildConfig> builds;
};

// Per-invocation parameters for one concrete target
struct BuildOptions {
    std::string target;
    std::string name;
    std::string path;
    std::string ext;
};

} // namespace crossforge
