#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <chrono>
#include <algorithm>
#include <cctype>
#include <array>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "artifact.hpp"
#include "context.hpp"
#include "timefmt.hpp"
#include "tmpl_engine.hpp"
#include "utils.hpp"

namespace crossforge::tmpl {

// Placeholder tag used when no VCS tag is known
inline constexpr auto PLACEHOLDER_TAG = "v0.0.0";

// Semver parts of a tag such as "v1.2.3-rc1"; missing parts are "0"
inline std::array<std::string, 3> semver_parts(std::string_view tag) {
    if (tag.starts_with('v')) tag.remove_prefix(1);
    std::array<std::string, 3> parts{"0", "0", "0"};
    const auto pieces = Strings::split(tag, '.');
    for (size_t i = 0; i < pieces.size() && i < parts.size(); ++i) {
        const auto& piece = pieces[i];
        const auto digits = std::find_if_not(piece.begin(), piece.end(),
                                             [](const unsigned char c) { return std::isdigit(c); });
        if (digits != piece.begin()) parts[i] = std::string(piece.begin(), digits);
    }
    return parts;
}

inline FuncMap default_funcs() {
    FuncMap funcs;
    funcs["time"] = {1, [](const std::vector<std::string>& a) {
        return format_go_time(a[0], std::chrono::system_clock::now());
    }};
    funcs["tolower"] = {1, [](const std::vector<std::string>& a) {
        std::string s = a[0];
        std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }};
    funcs["toupper"] = {1, [](const std::vector<std::string>& a) {
        std::string s = a[0];
        std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }};
    funcs["trim"] = {1, [](const std::vector<std::string>& a) { return Strings::trim(a[0]); }};
    funcs["replace"] = {3, [](const std::vector<std::string>& a) {
        const std::string& from = a[1];
        const std::string& to = a[2];
        std::string s = a[0];
        if (from.empty()) return s;
        for (size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size())) {
            s.replace(pos, from.size(), to);
        }
        return s;
    }};
    return funcs;
}

// Renders templates against the run context, optionally narrowed to one artifact.
class Template {
public:
    explicit Template(const Context& ctx) : funcs_(default_funcs()) {
        const std::string tag = ctx.git.current_tag.empty() ? PLACEHOLDER_TAG : ctx.git.current_tag;
        const auto [major, minor, patch] = semver_parts(tag);

        fields_.project_name = ctx.config.name;
        fields_.version = ctx.version;
        fields_.tag = tag;
        fields_.commit = ctx.git.commit;
        fields_.full_commit = ctx.git.commit;
        fields_.short_commit = ctx.git.short_commit;
        fields_.major = major;
        fields_.minor = minor;
        fields_.patch = patch;
        fields_.date = format_rfc3339(ctx.date);
        fields_.timestamp = std::to_string(
            std::chrono::duration_cast<std::chrono::seconds>(ctx.date.time_since_epoch()).count());
        fields_.env = ctx.env;
    }

    // Overlays KEY=VALUE entries on the environment; later entries win
    Template& with_env(const std::vector<std::string>& entries) {
        for (const auto& entry : entries) {
            auto [key, value] = Strings::split_env(entry);
            fields_.env[key] = value;
        }
        return *this;
    }

    Template& with_artifact(const Artifact& artifact) {
        fields_.os = artifact.goos;
        fields_.arch = artifact.goarch;
        fields_.arm = artifact.goarm;
        fields_.artifact_name = artifact.name;
        if (const auto it = artifact.extra.find("Binary"); it != artifact.extra.end()) {
            fields_.binary = it->second;
        }
        return *this;
    }

    [[nodiscard]] std::string apply(const std::string_view text) const {
        return execute(text, funcs_, fields_);
    }

    const Fields& fields() const { return fields_; }

private:
    Fields fields_;
    FuncMap funcs_;
};

// Renders every template and prepends `prefix`. Throws tmpl::Error on the
// first failing template.
inline std::vector<std::string> process_flags(const Context& ctx, const Artifact& artifact,
                                              const std::vector<std::string>& env,
                                              const std::vector<std::string>& flags,
                                              const std::string_view prefix) {
    std::vector<std::string> processed;
    if (flags.empty()) return processed;

    Template renderer(ctx);
    renderer.with_env(env).with_artifact(artifact);
    processed.reserve(flags.size());
    for (const auto& flag : flags) {
        processed.push_back(fmt::format("{}{}", prefix, renderer.apply(flag)));
    }
    return processed;
}

// Joins already rendered ldflags into a single toolchain argument
inline std::string join_ldflags(const std::vector<std::string>& rendered) {
    return fmt::format("-ldflags={}", fmt::join(rendered, " "));
}

} // namespace crossforge::tmpl
