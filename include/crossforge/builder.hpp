#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <regex>
#include <system_error>
#include <fmt/format.h>

#include "artifact.hpp"
#include "compiler.hpp"
#include "context.hpp"
#include "structs.hpp"
#include "targets.hpp"
#include "tmpl.hpp"
#include "utils.hpp"

namespace crossforge {

namespace fs = std::filesystem;

enum class ErrorKind {
    InvalidTarget,
    TemplateError,
    MissingEntryPoint,
    FileResolutionError,
    ToolchainFailure,
};

inline const char* error_kind_to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidTarget: return "InvalidTarget";
        case ErrorKind::TemplateError: return "TemplateError";
        case ErrorKind::MissingEntryPoint: return "MissingEntryPoint";
        case ErrorKind::FileResolutionError: return "FileResolutionError";
        case ErrorKind::ToolchainFailure: return "ToolchainFailure";
    }
    return "Unknown";
}

struct BuildError {
    ErrorKind kind;
    std::string message;
};

class EntryPoint {
public:
    // Wildcards are matched against file names only, never directories
    static bool has_directory_glob(const std::string& main) {
        return Strings::has_glob_chars(fs::path(main).parent_path().string());
    }

    // Source files named by `main`: a file, every *.go file of a directory,
    // or the files of the parent directory matching a glob. Sets `ec` when
    // nothing can be resolved.
    static std::vector<fs::path> resolve(const std::string& main, std::error_code& ec) {
        std::vector<fs::path> files;
        if (has_directory_glob(main)) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return files;
        }
        if (Strings::has_glob_chars(main)) {
            const fs::path pattern(main);
            const fs::path dir = pattern.has_parent_path() ? pattern.parent_path() : fs::path(".");
            const std::string name = pattern.filename().string();
            for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
                if (it->is_regular_file() && Strings::matches_pattern(it->path().filename().string(), name)) {
                    files.push_back(it->path());
                }
            }
            if (!ec && files.empty()) ec = std::make_error_code(std::errc::no_such_file_or_directory);
            return files;
        }

        const auto status = fs::status(main, ec);
        if (ec) return files;
        if (!fs::exists(status)) {
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
            return files;
        }
        if (!fs::is_directory(status)) {
            files.emplace_back(main);
            return files;
        }
        for (fs::directory_iterator it(main, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file() && it->path().extension() == ".go") {
                files.push_back(it->path());
            }
        }
        return files;
    }

    // True when the source declares a receiver-less `func main()` outside comments
    static bool has_main_function(const fs::path& file) {
        std::ifstream stream(file);
        if (!stream.is_open()) return false;

        const std::string content((std::istreambuf_iterator(stream)),
                                  std::istreambuf_iterator<char>());

        const std::regex main_pattern(R"((^|\n)\s*func\s+main\s*\(\s*\))");
        return std::regex_search(strip_comments(content), main_pattern);
    }

private:
    static std::string strip_comments(const std::string_view src) {
        std::string result;
        result.reserve(src.size());
        size_t i = 0;
        while (i < src.size()) {
            if (src.substr(i).starts_with("//")) {
                i = src.find('\n', i);
                if (i == std::string_view::npos) break;
            } else if (src.substr(i).starts_with("/*")) {
                const size_t end = src.find("*/", i + 2);
                if (end == std::string_view::npos) break;
                // keep line structure so `func` stays at a line start
                for (size_t k = i; k < end; ++k) {
                    if (src[k] == '\n') result += '\n';
                }
                result += ' ';
                i = end + 2;
            } else if (src[i] == '\'') {
                size_t end = i + 1;
                while (end < src.size() && src[end] != '\'' && src[end] != '\n') {
                    if (src[end] == '\\') ++end;
                    ++end;
                }
                result += "''";
                i = end < src.size() && src[end] == '\'' ? end + 1 : end;
            } else if (src[i] == '"' || src[i] == '`') {
                const char quote = src[i];
                size_t end = i + 1;
                while (end < src.size() && src[end] != quote) {
                    if (quote == '"' && src[end] == '\\') ++end;
                    ++end;
                }
                result += "\"\"";
                i = end + 1;
            } else {
                result += src[i++];
            }
        }
        return result;
    }
};

// Builds one target of one build configuration through the injected Compiler
// and records the produced binary in the context's registry.
class Builder {
public:
    explicit Builder(Compiler& compiler) : compiler_(compiler) {}

    [[nodiscard]] std::optional<BuildError> build(Context& ctx, const BuildConfig& build, const BuildOptions& options) const {
        const auto target = TargetMatrix::parse(options.target);
        if (!target) {
            return BuildError{ErrorKind::InvalidTarget, TargetMatrix::invalid_target_message(options.target)};
        }

        Artifact artifact{
            .name = options.name,
            .path = options.path,
            .goos = target->os,
            .goarch = target->arch,
            .goarm = target->arm,
            .type = ArtifactType::Binary,
            .extra = {{"Binary", build.binary}, {"ID", build.id}, {"Ext", options.ext}},
        };

        std::vector<std::string> env = build.env;
        const auto target_env = target->env();
        env.insert(env.end(), target_env.begin(), target_env.end());

        Invocation invocation{.program = "go", .args = {"build"}, .env = env};
        try {
            tmpl::Template binary_renderer(ctx);
            binary_renderer.with_env(env).with_artifact(artifact);
            artifact.extra["Binary"] = binary_renderer.apply(build.binary);

            auto append = [&invocation](const std::vector<std::string>& flags) {
                invocation.args.insert(invocation.args.end(), flags.begin(), flags.end());
            };
            append(tmpl::process_flags(ctx, artifact, env, build.flags, ""));
            append(tmpl::process_flags(ctx, artifact, env, build.asmflags, "-asmflags="));
            append(tmpl::process_flags(ctx, artifact, env, build.gcflags, "-gcflags="));
            invocation.args.push_back(tmpl::join_ldflags(tmpl::process_flags(ctx, artifact, env, build.ldflags, "")));
        } catch (const tmpl::Error& e) {
            return BuildError{ErrorKind::TemplateError, e.what()};
        }

        const std::string entry = build.main.empty() ? "." : build.main;
        if (auto error = check_main(build, entry)) {
            return error;
        }

        invocation.args.insert(invocation.args.end(), {"-o", options.path, entry});

        const CommandResult result = compiler_.run(invocation);
        if (result.exit_code != 0) {
            const std::string& diagnostic = result.stderr_output.empty() ? result.stdout_output : result.stderr_output;
            return BuildError{ErrorKind::ToolchainFailure,
                              fmt::format("failed to build for {}: {}", options.target, diagnostic)};
        }

        ctx.artifacts.add(std::move(artifact));
        return std::nullopt;
    }

private:
    Compiler& compiler_;

    static std::optional<BuildError> check_main(const BuildConfig& build, const std::string& main) {
        if (EntryPoint::has_directory_glob(main)) {
            return BuildError{ErrorKind::FileResolutionError,
                              fmt::format("main {}: wildcards are only allowed in the file name", main)};
        }
        std::error_code ec;
        const auto files = EntryPoint::resolve(main, ec);
        if (ec) {
            return BuildError{ErrorKind::FileResolutionError, fmt::format("stat {}: {}", main, ec.message())};
        }
        for (const auto& file : files) {
            if (EntryPoint::has_main_function(file)) return std::nullopt;
        }
        return BuildError{ErrorKind::MissingEntryPoint,
                          fmt::format("build for {} does not contain a main function", build.id.empty() ? build.binary : build.id)};
    }
};

} // namespace crossforge
