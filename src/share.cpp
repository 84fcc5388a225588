// Share root validation and enumeration

#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>
#include "protocol.hpp"
#include "share.hpp"

namespace fs = std::filesystem;

void validate_share_root(const std::string& path, bool create) {
    if (path.empty()) {
        throw ConfigError("Share directory not set");
    }

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (!create) {
            throw ConfigError(fmt::format("Share directory '{}' does not exist", path));
        }
        fs::create_directories(path, ec);
        if (ec) {
            throw ConfigError(fmt::format("Cannot create share directory '{}': {}",
                                          path, ec.message()));
        }
    }

    if (!fs::is_directory(path, ec)) {
        throw ConfigError(fmt::format("'{}' is not a directory", path));
    }

    // Listing needs read + search permission
    if (access(path.c_str(), R_OK | X_OK) != 0) {
        throw ConfigError(fmt::format("Share directory '{}' is not readable", path));
    }
}

std::vector<FileDescriptor> enumerate_share(const std::string& path) {
    std::vector<FileDescriptor> files;

    for (const auto& entry : fs::directory_iterator(path)) {
        // The directory's own regular files; symlinks are never followed
        std::error_code ec;
        if (!fs::is_regular_file(entry.symlink_status(ec))) continue;

        std::string name = entry.path().filename().string();
        if (!protocol::is_safe_name(name)) continue;

        uint64_t size = entry.file_size(ec);
        if (ec) continue;  // Removed between listing and stat

        files.push_back({name, size});
    }

    std::sort(files.begin(), files.end(),
              [](const FileDescriptor& a, const FileDescriptor& b) { return a.name < b.name; });
    return files;
}

size_t purge_sink(const std::string& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) return 0;

    size_t removed = 0;
    for (const auto& entry : fs::directory_iterator(path, ec)) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;
        if (fs::remove(entry.path(), entry_ec)) {
            removed++;
        } else if (entry_ec) {
            fmt::print(stderr, "Could not delete {}: {}\n", entry.path().string(), entry_ec.message());
        }
    }
    return removed;
}
