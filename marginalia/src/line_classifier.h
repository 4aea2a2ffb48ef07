/**
 * @file line_classifier.h
 * @brief One-of classification of a source line for the binding state machine.
 */

#pragma once

#include <string>

#include "declaration.h"

namespace marginalia {

enum class LineKind {
    Doc,           // "# doc: text"
    Meta,          // "# meta: tokens..."
    Skippable,     // blank, decorator, plain comment
    Declaration,   // def / class / assignment
    Other,
};

struct ClassifiedLine {
    LineKind kind = LineKind::Other;
    std::string doc_text;        // LineKind::Doc only
    Declaration declaration;     // LineKind::Declaration only
};

/// Name of a LineKind, for diagnostics and tests.
const char* line_kind_name(LineKind kind);

/// Doc marker check. Sets `*payload` to the text after "# doc:" with at
/// most one leading space removed.
bool is_doc_line(const std::string& line, std::string* payload);

/// Blank line, decorator ('@' first) or a comment that is not meta/doc.
bool is_skippable_line(const std::string& line);

/// Checks, in order: doc, meta, skippable, declaration.
ClassifiedLine classify_line(const std::string& line);

}  // namespace marginalia
