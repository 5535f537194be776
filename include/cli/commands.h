// CLI command function declarations
#pragma once

#include <cstdint>
#include <iostream>
#include <string>

#include "store/manifest_store.h"
#include "utils/cli.h"

namespace layerstore {
namespace cli {

/// Human readable size (B / KB / MB / GB, integer division)
std::string formatSize(uint64_t bytes);

namespace commands {

/// Execute the 'list' command
/// @return Exit code (0=success, 1=error)
int list(const ListOptions& options, const ManifestStore& store,
         std::ostream& out = std::cout, std::ostream& err = std::cerr);

/// Execute the 'show' command
/// @return Exit code (0=success, 1=error)
int show(const ShowOptions& options, const ManifestStore& store,
         std::ostream& out = std::cout, std::ostream& err = std::cerr);

/// Execute the 'rm' command (no confirmation)
/// @return Exit code (0=success, 1=error)
int rm(const RmOptions& options, const ManifestStore& store,
       std::ostream& out = std::cout, std::ostream& err = std::cerr);

/// Execute the 'verify' command
/// @return Exit code (0=all blobs intact, 1=error or mismatch)
int verify(const VerifyOptions& options, const ManifestStore& store,
           std::ostream& out = std::cout, std::ostream& err = std::cerr);

}  // namespace commands
}  // namespace cli
}  // namespace layerstore
