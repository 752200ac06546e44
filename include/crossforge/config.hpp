#pragma once
#include <string>
#include <cstdint>
#include <string_view>
#include <vector>
#include <filesystem>
#include <stdexcept>
#include <unordered_set>
#include <fmt/format.h>
#include <toml++/toml.hpp>

#include "log.hpp"
#include "structs.hpp"

namespace crossforge {

namespace fs = std::filesystem;

inline constexpr auto CONFIG_FILE_NAME = "crossforge.toml";

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Configuration {
public:
    static Project read_config_from_toml(const fs::path& toml_path) {
        if (!fs::exists(toml_path)) {
            throw ConfigError(fmt::format("'{}' not found", toml_path.string()));
        }
        try {
            const toml::table tbl = toml::parse_file(toml_path.string());
            return from_table(tbl);
        } catch (const toml::parse_error& err) {
            throw ConfigError(describe(toml_path.string(), err));
        }
    }

    // Same as read_config_from_toml for in-memory content; `source` names it in errors
    static Project parse_config(const std::string_view content, const std::string_view source = CONFIG_FILE_NAME) {
        try {
            const toml::table tbl = toml::parse(content, source);
            return from_table(tbl);
        } catch (const toml::parse_error& err) {
            throw ConfigError(describe(source, err));
        }
    }

    // Fills in names and rejects duplicate build ids
    static void validate(Project& project) {
        if (project.name.empty()) {
            project.name = fs::current_path().filename().string();
        }
        if (project.builds.empty()) {
            out::warn("No builds configured, using a single default build.");
            project.builds.emplace_back();
        }

        std::unordered_set<std::string> ids;
        for (auto& build : project.builds) {
            if (build.binary.empty()) build.binary = project.name;
            if (build.id.empty()) build.id = project.name;
            if (!ids.insert(build.id).second) {
                throw ConfigError(fmt::format("found 2 builds with the ID '{}', please fix your config", build.id));
            }
        }
    }

    // Builds selected by `id`, all of them when `id` is empty
    static std::vector<BuildConfig> select(const Project& project, const std::string_view id) {
        if (id.empty()) return project.builds;
        for (const auto& build : project.builds) {
            if (build.id == id) return {build};
        }
        throw ConfigError(fmt::format("no build with the ID '{}'", id));
    }

private:
    static std::string describe(const std::string_view source, const toml::parse_error& err) {
        const auto& begin = err.source().begin;
        return fmt::format("failed to parse '{}' at line {}, column {}: {}",
                           source, begin.line, begin.column, err.description());
    }

    static std::vector<std::string> string_array(const toml::node_view<const toml::node> node) {
        std::vector<std::string> values;
        if (const auto* arr = node.as_array()) {
            for (const auto& elem : *arr) {
                if (!elem.is_string()) {
                    throw ConfigError(fmt::format("expected an array of strings, got a {} element", toml_type_name(elem.type())));
                }
                values.emplace_back(elem.value_or(std::string{}));
            }
        }
        return values;
    }

    static std::string toml_type_name(const toml::node_type type) {
        switch (type) {
            case toml::node_type::table: return "table";
            case toml::node_type::array: return "array";
            case toml::node_type::integer: return "integer";
            case toml::node_type::floating_point: return "float";
            case toml::node_type::boolean: return "boolean";
            default: return "non-string";
        }
    }

    static Project from_table(const toml::table& tbl) {
        Project project;

        auto get_or = [&](const toml::node* node, const std::string& default_val) {
            return node ? node->value_or(default_val) : default_val;
        };

        project.name = get_or(tbl["project"]["name"].as_string(), "");
        project.dist = get_or(tbl["project"]["dist"].as_string(), project.dist);
        project.env = string_array(tbl["project"]["env"]);

        const int64_t parallelism = tbl["project"]["parallelism"].value_or(int64_t{0});
        if (parallelism < 0) {
            throw ConfigError(fmt::format("project.parallelism must not be negative, got {}", parallelism));
        }
        project.parallelism = static_cast<unsigned int>(parallelism);

        if (const auto* builds = tbl["builds"].as_array()) {
            for (const auto& build_node : *builds) {
                const auto* build_tbl = build_node.as_table();
                if (!build_tbl) {
                    throw ConfigError("each [[builds]] entry must be a table");
                }
                const toml::node_view<const toml::node> b{build_tbl};

                BuildConfig build;
                build.id = get_or(b["id"].as_string(), "");
                build.binary = get_or(b["binary"].as_string(), "");
                build.main = get_or(b["main"].as_string(), "");
                build.goos = string_array(b["goos"]);
                build.goarch = string_array(b["goarch"]);
                build.goarm = string_array(b["goarm"]);
                build.targets = string_array(b["targets"]);
                build.flags = string_array(b["flags"]);
                build.asmflags = string_array(b["asmflags"]);
                build.gcflags = string_array(b["gcflags"]);
                build.ldflags = string_array(b["ldflags"]);
                build.env = string_array(b["env"]);
                build.hooks.pre = get_or(b["hooks"]["pre"].as_string(), "");
                build.hooks.post = get_or(b["hooks"]["post"].as_string(), "");
                project.builds.push_back(std::move(build));
            }
        }

        return project;
    }
};

} // namespace crossforge
