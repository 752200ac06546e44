#pragma once
#include <string>
#include <vector>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "log.hpp"
#include "utils.hpp"

namespace crossforge {

// One toolchain call: program, its arguments, and the KEY=VALUE overrides
// applied on top of the parent environment.
struct Invocation {
    std::string program;
    std::vector<std::string> args;
    std::vector<std::string> env;

    std::vector<std::string> argv() const {
        std::vector<std::string> result{program};
        result.insert(result.end(), args.begin(), args.end());
        return result;
    }

    std::string str() const {
        return fmt::format("{}", fmt::join(argv(), " "));
    }
};

class Compiler {
public:
    virtual ~Compiler() = default;
    virtual CommandResult run(const Invocation& invocation) = 0;
};

// Spawns the real `go` toolchain
class GoCompiler final : public Compiler {
public:
    CommandResult run(const Invocation& invocation) override {
#ifdef CROSSFORGE_VERBOSE
        if (!invocation.env.empty()) {
            out::command("{} {}", fmt::join(invocation.env, " "), invocation.str());
        } else {
            out::command("{}", invocation.str());
        }
#endif
        return Execution::execute_vec(invocation.argv(), invocation.env);
    }
};

} // namespace crossforge
