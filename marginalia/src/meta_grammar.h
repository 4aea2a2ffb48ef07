/**
 * @file meta_grammar.h
 * @brief Token grammar of "# meta:" comment lines.
 *
 * A meta line is a '#' comment whose content starts with the literal
 * "meta:". The rest is whitespace-tokenised:
 *   - @name        anchor token      (name matches [A-Za-z0-9_-]+)
 *   - #id          explicit id token (non-empty suffix, kept verbatim)
 *   - key=v1,v2    key/value group   (key matches [A-Za-z0-9_-]+,
 *                                     values non-empty, no whitespace)
 */

#pragma once

#include <map>
#include <string>
#include <vector>

namespace marginalia {

using KeyValues = std::map<std::string, std::vector<std::string>>;

/// Structured tokens of one meta line.
struct ParsedMeta {
    std::string anchor;          // empty when the line has no anchor token
    std::string explicit_id;     // empty when the line has no id token
    KeyValues reserved;          // systems, roles, threads, callers, flags, assign_type
    KeyValues custom;            // every other key

    bool has_anchor() const { return !anchor.empty(); }
    bool has_explicit_id() const { return !explicit_id.empty(); }
};

/// True if the line is a meta comment (optional indent, '#', optional
/// whitespace, then the case-sensitive "meta:").
bool is_meta_line(const std::string& line);

/// True if `key` is handled by the reserved-field rules. "modules" counts
/// as reserved; it is stored under "systems".
bool is_reserved_key(const std::string& key);

/**
 * Parse one meta line.
 *
 * Repeated keys within the line keep the last value list. An empty meta
 * line ("# meta:") parses to an empty ParsedMeta.
 *
 * @param line   The raw source line.
 * @param out    Receives the tokens on success.
 * @param error  Receives the grammar error, naming the offending token.
 * @return false on any grammar violation.
 */
bool parse_meta_line(const std::string& line, ParsedMeta* out, std::string* error);

}  // namespace marginalia
