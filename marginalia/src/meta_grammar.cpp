/**
 * @file meta_grammar.cpp
 * @brief Hand-written scanner for the meta comment token grammar.
 */

#include "meta_grammar.h"

#include <cctype>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace marginalia {

namespace {

const char kMetaMarker[] = "meta:";
constexpr size_t kMetaMarkerLen = sizeof(kMetaMarker) - 1;

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/// [A-Za-z0-9_-]+
bool is_name(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

bool has_space(const std::string& s) {
    for (char c : s) {
        if (is_space(c)) return true;
    }
    return false;
}

/// Offset of the text following "meta:", or npos when the line is not a
/// meta comment.
size_t meta_body_offset(const std::string& line) {
    size_t pos = 0;
    while (pos < line.size() && is_space(line[pos])) ++pos;
    if (pos >= line.size() || line[pos] != '#') {
        return std::string::npos;
    }
    ++pos;
    while (pos < line.size() && is_space(line[pos])) ++pos;
    if (line.compare(pos, kMetaMarkerLen, kMetaMarker) != 0) {
        return std::string::npos;
    }
    return pos + kMetaMarkerLen;
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> parts;
    std::istringstream in(s);
    std::string part;
    while (in >> part) {
        parts.push_back(part);
    }
    return parts;
}

std::vector<std::string> split_commas(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t comma = s.find(',', start);
        if (comma == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, comma - start));
        start = comma + 1;
    }
    return parts;
}

}  // anonymous namespace


bool is_meta_line(const std::string& line) {
    return meta_body_offset(line) != std::string::npos;
}

bool is_reserved_key(const std::string& key) {
    return key == "systems" || key == "modules" || key == "roles" ||
           key == "threads" || key == "callers" || key == "flags" ||
           key == "assign_type";
}

bool parse_meta_line(const std::string& line, ParsedMeta* out, std::string* error) {
    size_t body = meta_body_offset(line);
    if (body == std::string::npos) {
        *error = "not a meta line";
        return false;
    }

    ParsedMeta parsed;

    for (const auto& part : split_whitespace(line.substr(body))) {
        // --- anchor token ---
        if (part[0] == '@') {
            std::string name = part.substr(1);
            if (!is_name(name)) {
                *error = "bad anchor token: " + part;
                return false;
            }
            parsed.anchor = name;
            continue;
        }

        // --- id token ---
        if (part[0] == '#') {
            if (part.size() == 1) {
                *error = "empty id token: " + part;
                return false;
            }
            parsed.explicit_id = part.substr(1);
            continue;
        }

        // --- key=value ---
        size_t eq = part.find('=');
        if (eq == std::string::npos) {
            *error = "bad entry (missing '='): " + part;
            return false;
        }
        if (part.find('=', eq + 1) != std::string::npos) {
            *error = "bad entry (more than one '='): " + part;
            return false;
        }

        std::string key = part.substr(0, eq);
        std::string value = part.substr(eq + 1);

        if (!is_name(key)) {
            *error = "bad key: " + key + " in " + part;
            return false;
        }

        std::vector<std::string> values;
        if (!value.empty()) {
            values = split_commas(value);
            for (const auto& v : values) {
                if (v.empty()) {
                    *error = "empty value in: " + part;
                    return false;
                }
                if (has_space(v)) {
                    *error = "bad value: " + v + " in " + part;
                    return false;
                }
            }
        }

        if (key == "modules") {
            key = "systems";
        }

        if (is_reserved_key(key)) {
            parsed.reserved[key] = std::move(values);   // last wins
        } else {
            parsed.custom[key] = std::move(values);     // last wins
        }
    }

    *out = std::move(parsed);
    return true;
}

}  // namespace marginalia
