/**
 * @file discovery.h
 * @brief Deterministic enumeration of the source files under a scan root.
 */

#pragma once

#include <string>
#include <vector>

namespace marginalia {

struct DiscoveryOptions {
    std::vector<std::string> include_globs = {"*.py", "*.pyw"};
    std::vector<std::string> exclude_names = {".git", "__pycache__", ".venv", "build", "dist"};
};

struct SourceFile {
    std::string path;            // absolute path to open
    std::string source_file;     // path relative to the scan base, '/' separated
};

/// fnmatch(3)-style match of a file or directory name against a glob.
bool glob_match(const std::string& pattern, const std::string& name);

/// Directory that relative names are computed from: the root itself when it
/// is a directory, its parent when it is a file.
std::string scan_base_dir(const std::string& root);

/**
 * List the files to scan under `root`.
 *
 * A directory root is walked recursively with entries visited in name
 * order; any file or directory whose name matches an exclude glob is
 * skipped, and files must match at least one include glob. A file root is
 * returned as-is, without filtering.
 *
 * @param root     Scan root (file or directory); must exist.
 * @param options  Include/exclude globs.
 * @param out      Receives the files in scan order.
 * @param error    Receives a description of a filesystem failure.
 * @return false if the root does not exist or cannot be walked.
 */
bool discover_source_files(const std::string& root,
                           const DiscoveryOptions& options,
                           std::vector<SourceFile>* out,
                           std::string* error);

}  // namespace marginalia
