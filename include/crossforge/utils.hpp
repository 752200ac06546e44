#pragma once
#include <string>
#include <string_view>
#include <filesystem>
#include <vector>
#include <array>
#include <sstream>
#include <cstdlib>
#include <climits>
#include <cerrno>
#include <cctype>
#include <sys/wait.h>
#include <sys/stat.h>
#include <unistd.h>
#include <poll.h>
#include <fcntl.h>

extern char** environ;

namespace crossforge {

namespace fs = std::filesystem;

// A struct to hold the result of a command execution
struct CommandResult {
    int exit_code{};
    std::string stdout_output;
    std::string stderr_output;
};

class Strings {
public:

    static bool matches_pattern(const std::string_view filename, const std::string_view pattern) {
        auto filename_it = filename.begin();
        auto pattern_it = pattern.begin();

        auto filename_star_it = filename.end(); // Pointers for backtracking
        auto pattern_star_it = pattern.end();

        while (filename_it != filename.end()) {
            if (pattern_it != pattern.end() && *pattern_it == '*') {
                pattern_star_it = pattern_it;
                filename_star_it = filename_it;
                ++pattern_it;
            } else if (pattern_it != pattern.end() && (*pattern_it == '?' || *pattern_it == *filename_it)) {
                ++filename_it;
                ++pattern_it;
            } else if (pattern_star_it != pattern.end()) {
                // Mismatch, but we have a '*' to backtrack to.
                pattern_it = pattern_star_it + 1;
                ++filename_star_it;
                filename_it = filename_star_it;
            } else {
                return false;
            }
        }

        while (pattern_it != pattern.end() && *pattern_it == '*') {
            ++pattern_it;
        }

        return pattern_it == pattern.end();
    }

    static bool has_glob_chars(const std::string_view s) {
        return s.find_first_of("*?[") != std::string_view::npos;
    }

    static std::vector<std::string> split(const std::string_view s, const char sep) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (true) {
            const size_t end = s.find(sep, start);
            if (end == std::string_view::npos) {
                parts.emplace_back(s.substr(start));
                return parts;
            }
            parts.emplace_back(s.substr(start, end - start));
            start = end + 1;
        }
    }

    static std::string trim(const std::string_view s) {
        const auto first = s.find_first_not_of(" \t\n\r");
        if (first == std::string_view::npos) return "";
        const auto last = s.find_last_not_of(" \t\n\r");
        return std::string(s.substr(first, last - first + 1));
    }

    // "KEY=VALUE" -> {KEY, VALUE}; a missing '=' yields an empty value
    static std::pair<std::string, std::string> split_env(const std::string_view entry) {
        const auto pos = entry.find('=');
        if (pos == std::string_view::npos) return {std::string(entry), ""};
        return {std::string(entry.substr(0, pos)), std::string(entry.substr(pos + 1))};
    }

    static std::vector<std::string> split_string(const std::string& cmd) {
        if (cmd.empty()) return {};

        std::vector<std::string> args;
        args.reserve(8);

        std::string current_arg;
        bool in_quotes = false;
        bool in_single_quotes = false;
        bool escape_next = false;

        for (const char c : cmd) {
            if (escape_next) {
                current_arg += c;
                escape_next = false;
                continue;
            }

            if (c == '\\' && !in_single_quotes) {
                escape_next = true;
                continue;
            }

            if (c == '"' && !in_single_quotes) {
                in_quotes = !in_quotes;
                continue;
            }

            if (c == '\'' && !in_quotes) {
                in_single_quotes = !in_single_quotes;
                continue;
            }

            if (std::isspace(static_cast<unsigned char>(c)) && !in_quotes && !in_single_quotes) {
                if (!current_arg.empty()) {
                    args.push_back(std::move(current_arg));
                    current_arg.clear();
                }
                continue;
            }

            current_arg += c;
        }

        if (!current_arg.empty()) {
            args.push_back(std::move(current_arg));
        }

        return args;
    }

};

class AsyncPipeReader {
public:
    static std::pair<std::string, std::string> readPipes(const int stdout_fd, const int stderr_fd) {
        fcntl(stdout_fd, F_SETFL, O_NONBLOCK);
        fcntl(stderr_fd, F_SETFL, O_NONBLOCK);

        PipeData stdout_data{stdout_fd, {}};
        PipeData stderr_data{stderr_fd, {}};

        std::array<char, 8192> read_buffer{};

        while (!stdout_data.finished || !stderr_data.finished) {
            std::array<pollfd, 2> fds = {{
                {stdout_data.finished ? -1 : stdout_fd, POLLIN, 0},
                {stderr_data.finished ? -1 : stderr_fd, POLLIN, 0}
            }};

            if (const int poll_result = poll(fds.data(), 2, 100); poll_result > 0) {
                if (fds[0].revents & (POLLIN | POLLHUP)) {
                    if (!readFromPipe(stdout_data, read_buffer)) stdout_data.finished = true;
                } else if (fds[0].revents & POLLERR) {
                    stdout_data.finished = true;
                }
                if (fds[1].revents & (POLLIN | POLLHUP)) {
                    if (!readFromPipe(stderr_data, read_buffer)) stderr_data.finished = true;
                } else if (fds[1].revents & POLLERR) {
                    stderr_data.finished = true;
                }
            }
        }

        return {std::move(stdout_data.buffer), std::move(stderr_data.buffer)};
    }

private:
    struct PipeData {
        int fd;
        std::string buffer;
        bool finished = false;
    };

    // false once the writer side is closed
    static bool readFromPipe(PipeData& pipe_data, std::array<char, 8192>& buffer) {
        const ssize_t bytes_read = read(pipe_data.fd, buffer.data(), buffer.size());
        if (bytes_read > 0) {
            pipe_data.buffer.append(buffer.data(), bytes_read);
            return true;
        }
        if (bytes_read < 0 && (errno == EAGAIN || errno == EINTR)) {
            return true;
        }
        return false;
    }
};

class Execution {
public:
    static bool isFileExecutable(const std::string& path) {
        char resolved_path[PATH_MAX];
        if (realpath(path.c_str(), resolved_path) == nullptr) {
            return false;
        }

        struct stat sb{};
        if (stat(resolved_path, &sb) != 0) {
            return false;
        }

        if (!S_ISREG(sb.st_mode)) {
            return false;
        }

        return access(resolved_path, X_OK) == 0;
    }

    // Full path of `command` searched in `path_env` (the parent's PATH by
    // default); empty when it is not an executable file.
    static std::string resolveCommand(const std::string& command, const char* path_env = std::getenv("PATH")) {
        if (command.empty() || command.find('\0') != std::string::npos) {
            return "";
        }

        if (command.find('/') != std::string::npos) {
            return isFileExecutable(command) ? command : "";
        }

        if (!path_env) {
            return "";
        }

        std::stringstream ss(path_env);
        std::string dir;

        while (std::getline(ss, dir, ':')) {
            if (dir.empty()) {
                continue;
            }

            std::string full_path = dir + "/" + command;

            if (full_path.length() >= PATH_MAX) {
                continue;
            }

            if (isFileExecutable(full_path)) {
                return full_path;
            }
        }

        return "";
    }

    // The child inherits the parent environment; entries of `env` override
    // variables with the same key.
    static std::vector<std::string> merge_environment(const std::vector<std::string>& env) {
        std::vector<std::string> merged;
        for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
            const std::string entry(*e);
            const auto key = Strings::split_env(entry).first;
            bool overridden = false;
            for (const auto& over : env) {
                if (Strings::split_env(over).first == key) {
                    overridden = true;
                    break;
                }
            }
            if (!overridden) merged.push_back(entry);
        }
        merged.insert(merged.end(), env.begin(), env.end());
        return merged;
    }

    static CommandResult execute_vec(const std::vector<std::string>& args, const std::vector<std::string>& env = {}) {
        if (args.empty()) {
            return {127, "", "Error: empty command"};
        }

        // Prepared before fork: the child only calls async-signal-safe functions
        const std::vector<std::string> env_strings = merge_environment(env);

        const char* child_path = nullptr;
        for (const auto& s : env_strings) {
            if (s.starts_with("PATH=")) child_path = s.c_str() + 5;
        }
        // Resolved against the child's PATH so a PATH override in `env` applies
        const std::string program = resolveCommand(args[0], child_path);
        if (program.empty()) {
            return {127, "", "Error: command not found or not executable: " + args[0]};
        }

        std::vector<char*> envp;
        envp.reserve(env_strings.size() + 1);
        for (const auto& s : env_strings) {
            envp.push_back(const_cast<char*>(s.c_str()));
        }
        envp.push_back(nullptr);

        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (const auto& s : args) {
            argv.push_back(const_cast<char*>(s.c_str()));
        }
        argv.push_back(nullptr);

        int stdout_pipe[2], stderr_pipe[2];
        if (pipe(stdout_pipe) == -1) {
            return {127, "", "Error: failed to create pipes"};
        }
        if (pipe(stderr_pipe) == -1) {
            close(stdout_pipe[0]); close(stdout_pipe[1]);
            return {127, "", "Error: failed to create pipes"};
        }

        const pid_t pid = fork();
        if (pid == -1) {
            close(stdout_pipe[0]); close(stdout_pipe[1]);
            close(stderr_pipe[0]); close(stderr_pipe[1]);
            return {127, "", "Error: fork failed"};
        }

        if (pid == 0) {
            dup2(stdout_pipe[1], STDOUT_FILENO);
            dup2(stderr_pipe[1], STDERR_FILENO);
            close(stdout_pipe[0]); close(stdout_pipe[1]);
            close(stderr_pipe[0]); close(stderr_pipe[1]);

            execve(program.c_str(), argv.data(), envp.data());
            _exit(127); // exec failed
        }

        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        auto [stdout_result, stderr_result] = AsyncPipeReader::readPipes(stdout_pipe[0], stderr_pipe[0]);

        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        int status = 0;
        while (waitpid(pid, &status, 0) == -1) {
            if (errno != EINTR) {
                return {127, std::move(stdout_result), "Error: waitpid failed"};
            }
        }

        int exit_code = -1;
        if (WIFEXITED(status)) {
            exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code = 128 + WTERMSIG(status);
        }

        return {exit_code, std::move(stdout_result), std::move(stderr_result)};
    }

    [[nodiscard]] static CommandResult execute(const std::string& cmd, const std::vector<std::string>& env = {}) {
        return execute_vec(Strings::split_string(cmd), env);
    }
};

} // namespace crossforge
