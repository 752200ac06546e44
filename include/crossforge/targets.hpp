#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <algorithm>
#include <unordered_set>
#include <fmt/format.h>

#include "structs.hpp"
#include "utils.hpp"

namespace crossforge {

// Default ldflags applied when a build configures none
inline constexpr auto DEFAULT_LDFLAGS =
    "-s -w -X main.version={{.Version}} -X main.commit={{.Commit}} -X main.date={{.Date}} -X main.builtBy=crossforge";

struct BuildTarget {
    std::string os;
    std::string arch;
    std::string arm;

    std::string str() const {
        if (arm.empty()) return fmt::format("{}_{}", os, arch);
        return fmt::format("{}_{}_{}", os, arch, arm);
    }

    // Toolchain environment selecting this platform
    std::vector<std::string> env() const {
        return {"GOOS=" + os, "GOARCH=" + arch, "GOARM=" + arm};
    }
};

class TargetMatrix {
public:

    // Known-valid os/arch pairs, as reported by `go tool dist list`
    static const std::vector<std::string_view>& valid_pairs() {
        static const std::vector<std::string_view> pairs = {
            "aix/ppc64",
            "android/386", "android/amd64", "android/arm", "android/arm64",
            "darwin/386", "darwin/amd64",
            "dragonfly/amd64",
            "freebsd/386", "freebsd/amd64", "freebsd/arm",
            "illumos/amd64",
            "js/wasm",
            "linux/386", "linux/amd64", "linux/arm", "linux/arm64", "linux/ppc64", "linux/ppc64le",
            "linux/mips", "linux/mipsle", "linux/mips64", "linux/mips64le", "linux/s390x",
            "netbsd/386", "netbsd/amd64", "netbsd/arm",
            "openbsd/386", "openbsd/amd64", "openbsd/arm",
            "plan9/386", "plan9/amd64",
            "solaris/amd64",
            "windows/386", "windows/amd64",
        };
        return pairs;
    }

    static const std::vector<std::string_view>& valid_arm_versions() {
        static const std::vector<std::string_view> versions = {"5", "6", "7"};
        return versions;
    }

    static bool is_valid_pair(const std::string_view os, const std::string_view arch) {
        const std::string pair = fmt::format("{}/{}", os, arch);
        return std::ranges::find(valid_pairs(), pair) != valid_pairs().end();
    }

    static bool is_valid_arm(const std::string_view arm) {
        return std::ranges::find(valid_arm_versions(), arm) != valid_arm_versions().end();
    }

    static bool is_valid(const BuildTarget& target) {
        if (!is_valid_pair(target.os, target.arch)) return false;
        if (target.arm.empty()) return true;
        return target.arch == "arm" && is_valid_arm(target.arm);
    }

    static std::string invalid_target_message(const std::string_view id) {
        return fmt::format("{} is not a valid build target", id);
    }

    // Parses and validates `os_arch` or `os_arch_armvariant`
    static std::optional<BuildTarget> parse(const std::string_view id) {
        const auto parts = Strings::split(id, '_');
        if (parts.size() != 2 && parts.size() != 3) return std::nullopt;

        BuildTarget target{parts[0], parts[1], parts.size() == 3 ? parts[2] : ""};
        if (parts.size() == 3 && target.arm.empty()) return std::nullopt;
        if (!is_valid(target)) return std::nullopt;
        return target;
    }

    // Product of goos x goarch (x goarm for arm), filtered and deduplicated
    static std::vector<std::string> expand(const BuildConfig& build) {
        std::vector<BuildTarget> candidates;
        for (const auto& os : build.goos) {
            for (const auto& arch : build.goarch) {
                if (arch == "arm") {
                    for (const auto& arm : build.goarm) {
                        candidates.push_back({os, arch, arm});
                    }
                    continue;
                }
                candidates.push_back({os, arch, ""});
            }
        }

        std::vector<std::string> targets;
        std::unordered_set<std::string> seen;
        for (const auto& candidate : candidates) {
            if (!is_valid(candidate)) continue;
            if (std::string id = candidate.str(); seen.insert(id).second) {
                targets.push_back(std::move(id));
            }
        }
        return targets;
    }

    // Returns a resolved copy; `build` itself is left untouched. A build that
    // already lists targets keeps them in order, minus repeated identifiers.
    static BuildConfig with_defaults(BuildConfig build) {
        if (build.main.empty()) build.main = ".";
        if (build.goos.empty()) build.goos = {"linux", "darwin"};
        if (build.goarch.empty()) build.goarch = {"amd64", "386"};
        if (build.goarm.empty()) build.goarm = {"6"};
        if (build.ldflags.empty()) build.ldflags = {DEFAULT_LDFLAGS};
        build.targets = build.targets.empty() ? expand(build) : unique(build.targets);
        return build;
    }

private:
    static std::vector<std::string> unique(const std::vector<std::string>& ids) {
        std::vector<std::string> result;
        std::unordered_set<std::string> seen;
        for (const auto& id : ids) {
            if (seen.insert(id).second) result.push_back(id);
        }
        return result;
    }
};

} // namespace crossforge
