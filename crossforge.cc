// CROSSFORGE - a cross-compilation orchestrator for Go toolchains written in modern C++
#include <filesystem>
#include <functional>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <fmt/format.h>
#include <fmt/color.h>
#include <fmt/ranges.h>

#include "crossforge/compiler.hpp"
#include "crossforge/config.hpp"
#include "crossforge/context.hpp"
#include "crossforge/git.hpp"
#include "crossforge/log.hpp"
#include "crossforge/manifest.hpp"
#include "crossforge/pipeline.hpp"
#include "crossforge/targets.hpp"
#include "crossforge/tmpl.hpp"

#define DATE __DATE__
#define TIME __TIME__
#define VERSION "0.1.0"

namespace fs = std::filesystem;
using namespace crossforge;

static constexpr auto COLOR_INFO = fmt::fg(fmt::color::dodger_blue);
static constexpr auto COLOR_SUCCESS = fmt::fg(fmt::color::lime_green) | fmt::emphasis::bold;
static constexpr auto COLOR_PROMPT = fmt::fg(fmt::color::cyan);

class Information {
public:
    static void show_version() {
        fmt::print("CrossForge {} compiled on {} at {}\n",
            fmt::styled(VERSION, COLOR_SUCCESS),
            fmt::styled(DATE, COLOR_INFO),
            fmt::styled(TIME, COLOR_INFO)
        );
    }

    static void show_help() {
        using fmt::styled;
        show_version();

        fmt::print(
            "\n"
            "Usage: crossforge <command> [flags]\n\n"
            "Commands:\n"
            "  {}      Builds every target of every build in '{}'.\n"
            "  {}    Prints the resolved target matrix of each build.\n"
            "  {}    Show current version and build date.\n"
            "  {}       Shows this help message.\n"
            "Flags:\n"
            "  {}   Read another config file.\n"
            "  {}       Only run the build with this ID.\n"
            "  {}   Only build this target (e.g. linux_arm_7).\n"
            "  {}       Skip git detection and use the {} placeholder tag.\n",
            styled("build", COLOR_PROMPT), CONFIG_FILE_NAME,
            styled("targets", COLOR_PROMPT),
            styled("version", COLOR_PROMPT),
            styled("help", COLOR_PROMPT),
            styled("--config <file>", COLOR_PROMPT),
            styled("--id <id>", COLOR_PROMPT),
            styled("--target <target>", COLOR_PROMPT),
            styled("--snapshot", COLOR_PROMPT), tmpl::PLACEHOLDER_TAG
        );
    }
};

struct CliOptions {
    fs::path config = CONFIG_FILE_NAME;
    std::string id;
    std::string target;
    bool snapshot = false;
};

class CLIHandler {
public:
    struct CommandResult {
        int exit_code = 0;
        bool handled = false;
    };

    CLIHandler();
    CommandResult handle_command(int argc, char* argv[]) const;

private:
    struct Command {
        std::string description;
        std::function<int(const std::vector<std::string>&)> handler;
        std::vector<std::string> aliases;
    };

    std::unordered_map<std::string, Command> commands_;

    static int handle_build(const std::vector<std::string>& args);
    static int handle_targets(const std::vector<std::string>& args);
    static int handle_help(const std::vector<std::string>& args);
    static int handle_version(const std::vector<std::string>& args);
    static std::optional<CliOptions> parse_options(const std::vector<std::string>& args);
    static std::optional<Project> load_project(const CliOptions& options);
    void register_commands();
};

CLIHandler::CLIHandler() {
    register_commands();
}

void CLIHandler::register_commands() {
    commands_["build"] = {"Build every configured target",
        &CLIHandler::handle_build, {"b"}};
    commands_["targets"] = {"Print the resolved target matrix",
        &CLIHandler::handle_targets, {"ls"}};
    commands_["help"] = {"Show help information",
        &CLIHandler::handle_help, {"-h", "--help"}};
    commands_["version"] = {"Show version information",
        &CLIHandler::handle_version, {"-v", "--version"}};

    // Register aliases
    std::vector<Command> registered;
    for (const auto& command_info : commands_ | std::views::values) {
        registered.push_back(command_info);
    }
    for (const auto& command_info : registered) {
        for (const auto& alias : command_info.aliases) {
            commands_[alias] = command_info;
        }
    }
}

CLIHandler::CommandResult CLIHandler::handle_command(const int argc, char* argv[]) const {
    const std::vector<std::string> args(argv, argv + argc);

    if (argc < 2) {
        return {handle_help(args), true};
    }
    if (commands_.contains(args[1])) {
        return {commands_.at(args[1]).handler(args), true};
    }
    return {1, false};
}

std::optional<CliOptions> CLIHandler::parse_options(const std::vector<std::string>& args) {
    CliOptions options;
    for (size_t i = 2; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= args.size()) {
                out::error("Flag '{}' expects a value.", arg);
                return std::nullopt;
            }
            return args[++i];
        };

        if (arg == "--snapshot") {
            options.snapshot = true;
        } else if (arg == "--config" || arg == "-f") {
            const auto v = value();
            if (!v) return std::nullopt;
            options.config = *v;
        } else if (arg == "--id") {
            const auto v = value();
            if (!v) return std::nullopt;
            options.id = *v;
        } else if (arg == "--target") {
            const auto v = value();
            if (!v) return std::nullopt;
            options.target = *v;
        } else {
            out::error("Unknown flag '{}'. Use 'crossforge help' for usage.", arg);
            return std::nullopt;
        }
    }
    return options;
}

std::optional<Project> CLIHandler::load_project(const CliOptions& options) {
    try {
        Project project = Configuration::read_config_from_toml(options.config);
        Configuration::validate(project);
        return project;
    } catch (const ConfigError& e) {
        out::error("{}", e.what());
        return std::nullopt;
    }
}

int CLIHandler::handle_build(const std::vector<std::string>& args) {
    const auto options = parse_options(args);
    if (!options) return 1;

    auto project = load_project(*options);
    if (!project) return 1;

    std::vector<BuildConfig> builds;
    try {
        builds = Configuration::select(*project, options->id);
    } catch (const ConfigError& e) {
        out::error("{}", e.what());
        return 1;
    }

    Context ctx(std::move(*project));
    if (!options->snapshot) {
        ctx.git = Git::detect();
    }
    if (ctx.git.current_tag.empty()) {
        if (!options->snapshot) out::warn("No git tag found, using {}.", tmpl::PLACEHOLDER_TAG);
        ctx.git.current_tag = tmpl::PLACEHOLDER_TAG;
    }
    ctx.version = Git::version_from_tag(ctx.git.current_tag);
    out::info("Building {} {} ({} build(s))", ctx.config.name, ctx.version, builds.size());

    GoCompiler compiler;
    Pipeline pipeline(ctx, compiler);
    const size_t failures = pipeline.run(builds, options->target);

    try {
        const auto manifest = Manifest::write(ctx.config.dist, ctx.artifacts.list());
        out::info("Wrote {} artifact(s) to '{}'.", ctx.artifacts.size(), manifest.string());
    } catch (const std::exception& e) {
        out::error("Failed to write the artifact manifest: {}", e.what());
        return 1;
    }

    if (failures != 0) {
        out::error("{} failure(s), {} artifact(s) built.", failures, ctx.artifacts.size());
        return 1;
    }
    out::success("All {} artifact(s) built.", ctx.artifacts.size());
    return 0;
}

int CLIHandler::handle_targets(const std::vector<std::string>& args) {
    const auto options = parse_options(args);
    if (!options) return 1;

    const auto project = load_project(*options);
    if (!project) return 1;

    for (const auto& build : project->builds) {
        if (!options->id.empty() && build.id != options->id) continue;
        const auto resolved = TargetMatrix::with_defaults(build);
        fmt::print("{}: {}\n", fmt::styled(build.id, COLOR_PROMPT), fmt::join(resolved.targets, " "));
    }
    return 0;
}

int CLIHandler::handle_help(const std::vector<std::string>&) {
    Information::show_help();
    return 0;
}

int CLIHandler::handle_version(const std::vector<std::string>&) {
    Information::show_version();
    return 0;
}

int main(const int argc, char* argv[]) {
    const CLIHandler cli;
    auto [exit_code, handled] = cli.handle_command(argc, argv);

    if (!handled) {
        out::error("Unknown command {}. Use 'crossforge help' for usage.", argv[1]);
        return 1;
    }

    return exit_code;
}
