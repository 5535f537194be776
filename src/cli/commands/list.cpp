// layerstore list: locally stored models

#include "cli/commands.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace layerstore {
namespace cli {

std::string formatSize(uint64_t size) {
    if (size >= 1024ULL * 1024 * 1024) {
        return std::to_string(size / (1024ULL * 1024 * 1024)) + " GB";
    }
    if (size >= 1024ULL * 1024) {
        return std::to_string(size / (1024ULL * 1024)) + " MB";
    }
    if (size >= 1024ULL) {
        return std::to_string(size / 1024ULL) + " KB";
    }
    return std::to_string(size) + " B";
}

namespace {

std::string formatModified(fs::file_time_type ftime) {
    // file_clock has no portable conversion in C++17; shift by the current offset
    auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    std::time_t t = std::chrono::system_clock::to_time_t(sctp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return oss.str();
}

}  // namespace

namespace commands {

int list(const ListOptions& options, const ManifestStore& store, std::ostream& out, std::ostream& err) {
    auto result = store.listAll(options.strict ? ScanPolicy::kStrict : ScanPolicy::kBestEffort);
    if (!result.ok()) {
        err << "Error: " << result.error_message << std::endl;
        return 1;
    }

    out << std::left
        << std::setw(40) << "NAME"
        << std::setw(14) << "ID"
        << std::setw(12) << "SIZE"
        << std::setw(20) << "MODIFIED"
        << std::endl;

    for (const auto& [name, manifest] : *result.data) {
        out << std::left
            << std::setw(40) << name.displayShortest()
            << std::setw(14) << manifest.digest.substr(0, 12)
            << std::setw(12) << formatSize(static_cast<uint64_t>(manifest.size()))
            << std::setw(20) << formatModified(manifest.modified)
            << std::endl;
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace layerstore
