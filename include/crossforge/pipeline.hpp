#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <thread>
#include <atomic>
#include <algorithm>
#include <filesystem>
#include <fmt/format.h>

#include "artifact.hpp"
#include "builder.hpp"
#include "compiler.hpp"
#include "context.hpp"
#include "log.hpp"
#include "structs.hpp"
#include "targets.hpp"
#include "tmpl.hpp"
#include "utils.hpp"

namespace crossforge {

namespace fs = std::filesystem;

// Runs every build of a project across its target matrix: hooks, output
// layout and worker threads around Builder.
class Pipeline {
public:
    Pipeline(Context& ctx, Compiler& compiler) : ctx_(ctx), builder_(compiler) {}

    static std::string extension_for(const BuildTarget& target) {
        if (target.os == "windows") return ".exe";
        if (target.os == "js" && target.arch == "wasm") return ".wasm";
        return "";
    }

    // <dist>/<id>_<target>/<binary><ext>; throws tmpl::Error when `binary` does not render
    BuildOptions options_for(const BuildConfig& build, const BuildTarget& target) const {
        Artifact platform;
        platform.goos = target.os;
        platform.goarch = target.arch;
        platform.goarm = target.arm;

        tmpl::Template renderer(ctx_);
        renderer.with_env(build.env).with_artifact(platform);
        const std::string binary = renderer.apply(build.binary);

        BuildOptions options;
        options.target = target.str();
        options.ext = extension_for(target);
        options.name = binary + options.ext;
        options.path = (fs::path(ctx_.config.dist) / fmt::format("{}_{}", build.id, options.target) / options.name).string();
        return options;
    }

    // Builds the selected targets (all of them when `only_target` is empty).
    // Returns the number of failed targets and hooks.
    size_t run(const std::vector<BuildConfig>& builds, const std::string_view only_target = "") {
        size_t failures = 0;
        for (const auto& configured : builds) {
            const BuildConfig build = TargetMatrix::with_defaults(configured);

            std::vector<Job> jobs;
            for (const auto& id : build.targets) {
                if (!only_target.empty() && id != only_target) continue;
                jobs.push_back(plan(build, id, failures));
            }
            if (!only_target.empty() && jobs.empty()) {
                // an explicit target outside the matrix still goes through validation
                jobs.push_back(plan(build, std::string(only_target), failures));
            }
            std::erase_if(jobs, [](const Job& job) { return job.options.target.empty(); });
            if (jobs.empty()) continue;

            if (!run_hook(build, "pre", build.hooks.pre)) {
                ++failures;
                continue;
            }

            failures += run_jobs(build, jobs);

            if (!run_hook(build, "post", build.hooks.post)) {
                ++failures;
            }
        }
        return failures;
    }

private:
    struct Job {
        BuildOptions options;
    };

    Context& ctx_;
    Builder builder_;

    // An empty target in the returned job marks it as already failed
    Job plan(const BuildConfig& build, const std::string& id, size_t& failures) const {
        const auto target = TargetMatrix::parse(id);
        if (!target) {
            out::error("[{}] {}", build.id, TargetMatrix::invalid_target_message(id));
            ++failures;
            return {};
        }
        try {
            return {options_for(build, *target)};
        } catch (const tmpl::Error& e) {
            out::error("[{}] {}: {}", build.id, error_kind_to_string(ErrorKind::TemplateError), e.what());
            ++failures;
            return {};
        }
    }

    bool run_hook(const BuildConfig& build, const std::string_view stage, const std::string& hook) const {
        if (hook.empty()) return true;
        out::command("{}", hook);
        const auto result = Execution::execute(hook, build.env);
        if (result.exit_code != 0) {
            out::error("[{}] {} hook failed with exit code {}: {}", build.id, stage, result.exit_code,
                       Strings::trim(result.stderr_output.empty() ? result.stdout_output : result.stderr_output));
            return false;
        }
        return true;
    }

    size_t run_jobs(const BuildConfig& build, const std::vector<Job>& jobs) {
        const unsigned int configured = ctx_.config.parallelism != 0
            ? ctx_.config.parallelism
            : std::max(1u, std::thread::hardware_concurrency());
        const size_t num_threads = std::min(jobs.size(), static_cast<size_t>(configured));

        std::atomic<size_t> next{0};
        std::atomic<size_t> failed{0};
        std::vector<std::thread> workers;
        workers.reserve(num_threads);

        for (size_t t = 0; t < num_threads; ++t) {
            workers.emplace_back([&] {
                size_t idx;
                while ((idx = next.fetch_add(1)) < jobs.size()) {
                    const auto& options = jobs[idx].options;
                    std::error_code ec;
                    fs::create_directories(fs::path(options.path).parent_path(), ec);
                    if (ec) {
                        out::error("[{}] cannot create '{}': {}", build.id, fs::path(options.path).parent_path().string(), ec.message());
                        ++failed;
                        continue;
                    }

                    out::info("[{}] Building {}...", build.id, options.target);
                    if (const auto error = builder_.build(ctx_, build, options)) {
                        out::error("[{}] {}: {}", build.id, error_kind_to_string(error->kind), error->message);
                        ++failed;
                        continue;
                    }
                    out::success("[{}] Built {}", build.id, options.path);
                }
            });
        }

        for (auto& worker : workers) {
            worker.join();
        }
        return failed.load();
    }
};

} // namespace crossforge
