/**
 * @file output.h
 * @brief JSON formatting, atomic file writes and artifact routing.
 */

#pragma once

#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "events.h"

namespace marginalia {

enum class JsonStyle {
    Compact,     // no whitespace, no trailing newline
    Pretty,      // 2-space indent, trailing newline
};

std::string dump_json(const nlohmann::ordered_json& j, JsonStyle style);

/// Where an artifact goes: standard output or a file path.
struct Destination {
    bool to_stdout = false;
    std::string path;
};

/// "stdout" routes to standard output, an empty value to `default_path`,
/// anything else is taken as a file path.
Destination route(const std::string& value, const std::string& default_path);

/**
 * Write `text` to `path` through a temporary file in the same directory,
 * then rename it into place. Parent directories are created as needed.
 *
 * @return false with `*error` set on failure; the temporary file is removed.
 */
bool write_text_atomic(const std::string& path, const std::string& text, std::string* error);

/// Emit one artifact. Failures are recorded as write-failed events.
bool emit_json(const nlohmann::ordered_json& j,
               const Destination& dest,
               JsonStyle style,
               std::ostream& out,
               EventLog* events);

}  // namespace marginalia
