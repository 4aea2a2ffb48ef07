/**
 * @file declaration.cpp
 * @brief Line-level recognition of def / class / assignment statements.
 *
 * No tokenizer: each pattern is matched by walking the line once from the
 * first non-blank character.
 */

#include "declaration.h"

#include <cctype>
#include <string>

namespace marginalia {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

size_t skip_spaces(const std::string& line, size_t pos) {
    while (pos < line.size() && is_space(line[pos])) ++pos;
    return pos;
}

/// Read [A-Za-z_][A-Za-z0-9_]* at `*pos`; advances past it on success.
bool read_identifier(const std::string& line, size_t* pos, std::string* out) {
    size_t start = *pos;
    if (start >= line.size() || !is_ident_start(line[start])) {
        return false;
    }
    size_t end = start + 1;
    while (end < line.size() && is_ident_char(line[end])) ++end;
    *out = line.substr(start, end - start);
    *pos = end;
    return true;
}

/// Match `keyword` followed by at least one whitespace character.
bool read_keyword(const std::string& line, size_t* pos, const char* keyword) {
    std::string kw(keyword);
    if (line.compare(*pos, kw.size(), kw) != 0) {
        return false;
    }
    size_t after = *pos + kw.size();
    if (after >= line.size() || !is_space(line[after])) {
        return false;
    }
    *pos = skip_spaces(line, after);
    return true;
}


bool match_function(const std::string& line, size_t start, std::string* name) {
    size_t pos = start;
    size_t async_pos = pos;
    if (read_keyword(line, &async_pos, "async")) {
        pos = async_pos;
    }
    if (!read_keyword(line, &pos, "def")) return false;
    if (!read_identifier(line, &pos, name)) return false;
    pos = skip_spaces(line, pos);
    return pos < line.size() && line[pos] == '(';
}

bool match_class(const std::string& line, size_t start, std::string* name) {
    size_t pos = start;
    if (!read_keyword(line, &pos, "class")) return false;
    if (!read_identifier(line, &pos, name)) return false;
    pos = skip_spaces(line, pos);
    return pos < line.size() && (line[pos] == '(' || line[pos] == ':');
}

bool match_assignment(const std::string& line, size_t start, std::string* name) {
    size_t pos = start;
    if (!read_identifier(line, &pos, name)) return false;
    pos = skip_spaces(line, pos);
    if (pos >= line.size() || line[pos] != '=') return false;
    return pos + 1 >= line.size() || line[pos + 1] != '=';
}

}  // anonymous namespace


Declaration find_declaration(const std::string& line) {
    Declaration decl;
    size_t start = skip_spaces(line, 0);

    if (match_function(line, start, &decl.symbol)) {
        decl.type = SymbolType::Function;
        decl.valid = true;
    } else if (match_class(line, start, &decl.symbol)) {
        decl.type = SymbolType::Class;
        decl.valid = true;
    } else if (match_assignment(line, start, &decl.symbol)) {
        decl.type = SymbolType::Variable;
        decl.valid = true;
    } else {
        decl.symbol.clear();
    }
    return decl;
}

}  // namespace marginalia
