#pragma once

#include <filesystem>
#include <system_error>

namespace layerstore {

// Remove every empty directory below root, deepest first. Directories that
// only contained empty directories are removed too. root itself is kept.
// Returns the first filesystem error; pruning stops there.
std::error_code prune_directory(const std::filesystem::path& root);

}  // namespace layerstore
