#pragma once
#include <string>
#include <vector>
#include "common.hpp"

// Checks the share root before the server accepts anything.
// Throws ConfigError if `path` is missing, not a directory, or unreadable.
// With `create`, a missing directory is created first.
void validate_share_root(const std::string& path, bool create = false);

// Direct regular-file children of `path`, sorted by name. Subdirectories,
// symlinks to directories and unsafe names are skipped. Sizes are taken
// once, here; nothing is cached between calls.
// Throws std::filesystem::filesystem_error if the directory cannot be listed.
std::vector<FileDescriptor> enumerate_share(const std::string& path);

// Deletes every regular file directly under `path`. Returns the count
// removed; a missing directory counts as zero.
size_t purge_sink(const std::string& path);
