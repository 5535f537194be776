#include "utils/prune.h"

#include <vector>

namespace fs = std::filesystem;

namespace layerstore {

namespace {

std::error_code prune_recursive(const fs::path& dir, bool keep) {
    std::error_code ec;
    std::vector<fs::path> subdirs;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        // symlinked directories are left alone
        if (it->is_directory(ec) && !it->is_symlink(ec)) {
            subdirs.push_back(it->path());
        }
    }
    if (ec) return ec;

    for (const auto& sub : subdirs) {
        if (auto err = prune_recursive(sub, false)) return err;
    }

    if (keep) return {};
    if (fs::is_empty(dir, ec) && !ec) {
        fs::remove(dir, ec);
    }
    return ec;
}

}  // namespace

std::error_code prune_directory(const fs::path& root) {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory);
    }
    return prune_recursive(root, true);
}

}  // namespace layerstore
