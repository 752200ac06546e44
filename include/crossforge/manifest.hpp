#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <xxhash.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

#include "artifact.hpp"

namespace crossforge {

namespace fs = std::filesystem;

inline constexpr auto MANIFEST_FILE_NAME = "artifacts.json";

class Manifest {
public:
    // XXH64 of the file contents as 16 hex digits, empty when unreadable
    static std::string hash_file(const fs::path& path) {
        const int fd = open(path.c_str(), O_RDONLY);
        if (fd == -1) return "";

        struct stat sb{};
        if (fstat(fd, &sb) == -1) {
            close(fd);
            return "";
        }

        if (sb.st_size == 0) {
            close(fd);
            return "ef46db3751d8e999"; // XXH64 of empty data
        }

        void* mapped = mmap(nullptr, sb.st_size, PROT_READ, MAP_PRIVATE, fd, 0);
        if (mapped == MAP_FAILED) {
            close(fd);
            return "";
        }

        madvise(mapped, sb.st_size, MADV_SEQUENTIAL);

        const XXH64_hash_t hash_val = XXH64(mapped, sb.st_size, 0);

        munmap(mapped, sb.st_size);
        close(fd);

        return fmt::format("{:016x}", hash_val);
    }

    static nlohmann::json to_json(const Artifact& artifact) {
        return {
            {"name", artifact.name},
            {"path", artifact.path},
            {"goos", artifact.goos},
            {"goarch", artifact.goarch},
            {"goarm", artifact.goarm},
            {"type", artifact_type_to_string(artifact.type)},
            {"extra", artifact.extra},
            {"digest", hash_file(artifact.path)},
        };
    }

    static nlohmann::json to_json(const std::vector<Artifact>& artifacts) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& artifact : artifacts) {
            arr.push_back(to_json(artifact));
        }
        return arr;
    }

    // Writes <dist>/artifacts.json, creating `dist` if needed. Throws on I/O failure.
    static fs::path write(const fs::path& dist, const std::vector<Artifact>& artifacts) {
        fs::create_directories(dist);
        const fs::path path = dist / MANIFEST_FILE_NAME;
        std::ofstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error(fmt::format("failed to open '{}' for writing", path.string()));
        }
        file << to_json(artifacts).dump(2) << '\n';
        return path;
    }
};

} // namespace crossforge
