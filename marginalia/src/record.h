/**
 * @file record.h
 * @brief Inventory record model and the field normalisation rules.
 *
 * A Record is one annotated symbol as it appears in the inventory artifact:
 *   - locator (symbol, symbol_type, source_file, line_number)
 *   - provenance (raw comment lines, doc lines)
 *   - reserved tag fields (systems, roles, threads, callers, flags, assign_type)
 *   - free-form custom key/value lists
 *
 * Serialised via nlohmann::ordered_json so the field order is stable.
 */

#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace marginalia {

// ------------------------------------------------------------------
// Symbol kinds
// ------------------------------------------------------------------

enum class SymbolType {
    Function,
    Class,
    Variable,
    Anchor,
};

/// Name used in the inventory artifact ("function", "class", ...).
const char* symbol_type_name(SymbolType type);

/// Inverse of symbol_type_name(). Returns false for unknown names.
bool parse_symbol_type(const std::string& name, SymbolType* out);

// ------------------------------------------------------------------
// Callers: "*" | count | list of caller names
// ------------------------------------------------------------------

struct Callers {
    enum class Kind {
        Wildcard,
        Count,
        List,
    };

    Kind kind = Kind::Wildcard;
    long long count = 0;
    std::vector<std::string> names;

    static Callers wildcard() { return Callers{}; }

    static Callers of_count(long long n) {
        Callers c;
        c.kind = Kind::Count;
        c.count = n;
        return c;
    }

    static Callers of_names(std::vector<std::string> names) {
        Callers c;
        c.kind = Kind::List;
        c.names = std::move(names);
        return c;
    }
};

bool operator==(const Callers& lhs, const Callers& rhs);
inline bool operator!=(const Callers& lhs, const Callers& rhs) { return !(lhs == rhs); }

// ------------------------------------------------------------------
// Record
// ------------------------------------------------------------------

using CustomFields = std::map<std::string, std::vector<std::string>>;

struct Record {
    std::string id;
    std::string symbol;
    SymbolType symbol_type = SymbolType::Function;
    std::string source_file;
    int line_number = 0;
    std::vector<std::string> raw;
    std::vector<std::string> doc;
    std::vector<std::string> systems;
    std::vector<std::string> roles;
    std::vector<std::string> threads;
    Callers callers;
    std::string flags;           // one character per flag, first-seen order
    std::string assign_type;
    CustomFields custom;
};

// ------------------------------------------------------------------
// Normalisation rules
// ------------------------------------------------------------------

/// ASCII lowercase copy.
std::string to_lower(std::string s);

/// Append `values` to `target`, lowercasing each and dropping any value
/// already present (compared lowercase). First occurrence order is kept.
void extend_normalised(std::vector<std::string>* target,
                       const std::vector<std::string>& values);

/// Append the characters of `chars` that are not in `flags` yet.
void extend_flags(std::string* flags, const std::string& chars);

/// Concatenate flag values and deduplicate by first occurrence.
std::string normalise_flags(const std::vector<std::string>& values);

/// No values or a lone "*" is the wildcard, a lone all-digit value a count,
/// anything else the verbatim list of caller names.
Callers parse_callers(const std::vector<std::string>& values);

/// Append every custom list of `from` to the same key of `into`.
void extend_custom(CustomFields* into, const CustomFields& from);

// ------------------------------------------------------------------
// JSON serialisation (nlohmann/json ADL)
// ------------------------------------------------------------------

void to_json(nlohmann::ordered_json& j, const Callers& c);
void to_json(nlohmann::ordered_json& j, const Record& r);

/**
 * Strictly decode one inventory entry.
 *
 * The object must carry exactly the Record fields with the expected JSON
 * types; anything missing, extra or mistyped is rejected.
 *
 * @param j      One element of the inventory array.
 * @param out    Receives the decoded record on success.
 * @param error  Receives a description of the first problem on failure.
 * @return true on success.
 */
bool decode_record(const nlohmann::ordered_json& j, Record* out, std::string* error);

/// Decode a whole inventory artifact (a JSON array of records).
bool decode_inventory(const nlohmann::ordered_json& j,
                      std::vector<Record>* out,
                      std::string* error);

}  // namespace marginalia
