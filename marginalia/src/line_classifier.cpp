/**
 * @file line_classifier.cpp
 * @brief Line classification on top of the meta grammar and declaration detector.
 */

#include "line_classifier.h"

#include <cctype>
#include <string>

#include "meta_grammar.h"

namespace marginalia {

namespace {

const char kDocMarker[] = "# doc:";
constexpr size_t kDocMarkerLen = sizeof(kDocMarker) - 1;

size_t first_non_blank(const std::string& line) {
    size_t pos = 0;
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
    return pos;
}

}  // anonymous namespace


const char* line_kind_name(LineKind kind) {
    switch (kind) {
        case LineKind::Doc:         return "doc";
        case LineKind::Meta:        return "meta";
        case LineKind::Skippable:   return "skippable";
        case LineKind::Declaration: return "declaration";
        case LineKind::Other:       return "other";
    }
    return "other";
}

bool is_doc_line(const std::string& line, std::string* payload) {
    size_t pos = first_non_blank(line);
    if (line.compare(pos, kDocMarkerLen, kDocMarker) != 0) {
        return false;
    }
    pos += kDocMarkerLen;
    if (pos < line.size() && line[pos] == ' ') ++pos;
    *payload = line.substr(pos);
    return true;
}

bool is_skippable_line(const std::string& line) {
    size_t pos = first_non_blank(line);
    if (pos >= line.size()) return true;
    return line[pos] == '@' || line[pos] == '#';
}

ClassifiedLine classify_line(const std::string& line) {
    ClassifiedLine out;

    if (is_doc_line(line, &out.doc_text)) {
        out.kind = LineKind::Doc;
        return out;
    }
    if (is_meta_line(line)) {
        out.kind = LineKind::Meta;
        return out;
    }
    // Meta and doc lines are comments too, so they must be ruled out first.
    if (is_skippable_line(line)) {
        out.kind = LineKind::Skippable;
        return out;
    }

    out.declaration = find_declaration(line);
    out.kind = out.declaration.valid ? LineKind::Declaration : LineKind::Other;
    return out;
}

}  // namespace marginalia
