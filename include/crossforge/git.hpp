#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "context.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace crossforge {

class Git {
public:
    // Tag and commit of the working tree; a failing query leaves its field empty
    static GitInfo detect() {
        GitInfo info;
        info.current_tag = query({"git", "describe", "--tags", "--abbrev=0"});
        info.commit = query({"git", "rev-parse", "HEAD"});
        info.short_commit = query({"git", "rev-parse", "--short", "HEAD"});
        return info;
    }

    // "v1.2.3" -> "1.2.3"
    static std::string version_from_tag(const std::string_view tag) {
        if (tag.starts_with('v')) return std::string(tag.substr(1));
        return std::string(tag);
    }

private:
    static std::string query(const std::vector<std::string>& args) {
        const auto result = Execution::execute_vec(args);
        if (result.exit_code != 0) {
            out::warn("'{} {}' failed: {}", args[0], args[1], Strings::trim(result.stderr_output));
            return "";
        }
        return Strings::trim(result.stdout_output);
    }
};

} // namespace crossforge
