/**
 * @file discovery.cpp
 * @brief Recursive, name-ordered source file walk using std::filesystem.
 */

#include "discovery.h"

#include <fnmatch.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace marginalia {

namespace {

bool matches_any(const std::vector<std::string>& globs, const std::string& name) {
    for (const auto& glob : globs) {
        if (glob_match(glob, name)) return true;
    }
    return false;
}

fs::path normalised_absolute(const std::string& root) {
    fs::path p = fs::absolute(fs::path(root)).lexically_normal();
    if (p.filename().empty() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();   // "dir/" -> "dir"
    }
    return p;
}

std::string relative_name(const fs::path& file, const fs::path& base) {
    return file.lexically_relative(base).generic_string();
}

bool walk_directory(const fs::path& dir,
                    const fs::path& base,
                    const DiscoveryOptions& options,
                    std::vector<SourceFile>* out,
                    std::string* error) {
    std::error_code ec;
    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        *error = "cannot list " + dir.string() + ": " + ec.message();
        return false;
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });

    for (const auto& entry : entries) {
        const std::string name = entry.path().filename().string();

        // Excludes apply to files and directories alike.
        if (matches_any(options.exclude_names, name)) {
            continue;
        }

        if (entry.is_directory(ec)) {
            if (entry.is_symlink(ec)) {
                continue;
            }
            if (!walk_directory(entry.path(), base, options, out, error)) {
                return false;
            }
            continue;
        }

        if (entry.is_regular_file(ec) && matches_any(options.include_globs, name)) {
            out->push_back(SourceFile{entry.path().string(), relative_name(entry.path(), base)});
        }
    }
    return true;
}

}  // anonymous namespace


bool glob_match(const std::string& pattern, const std::string& name) {
    return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

std::string scan_base_dir(const std::string& root) {
    fs::path abs = normalised_absolute(root);
    std::error_code ec;
    if (fs::is_directory(abs, ec)) {
        return abs.string();
    }
    return abs.parent_path().string();
}

bool discover_source_files(const std::string& root,
                           const DiscoveryOptions& options,
                           std::vector<SourceFile>* out,
                           std::string* error) {
    fs::path abs = normalised_absolute(root);

    std::error_code ec;
    if (!fs::exists(abs, ec)) {
        *error = "path does not exist: " + root;
        return false;
    }

    out->clear();
    fs::path base(scan_base_dir(root));

    if (!fs::is_directory(abs, ec)) {
        out->push_back(SourceFile{abs.string(), relative_name(abs, base)});
        return true;
    }
    return walk_directory(abs, base, options, out, error);
}

}  // namespace marginalia
