/**
 * @file record.cpp
 * @brief Record normalisation helpers and the inventory JSON codec.
 */

#include "record.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <set>
#include <string>
#include <vector>

namespace marginalia {

// ==================================================================
// Symbol kinds
// ==================================================================

const char* symbol_type_name(SymbolType type) {
    switch (type) {
        case SymbolType::Function: return "function";
        case SymbolType::Class:    return "class";
        case SymbolType::Variable: return "variable";
        case SymbolType::Anchor:   return "anchor";
    }
    return "function";
}

bool parse_symbol_type(const std::string& name, SymbolType* out) {
    if (name == "function")      *out = SymbolType::Function;
    else if (name == "class")    *out = SymbolType::Class;
    else if (name == "variable") *out = SymbolType::Variable;
    else if (name == "anchor")   *out = SymbolType::Anchor;
    else return false;
    return true;
}

bool operator==(const Callers& lhs, const Callers& rhs) {
    if (lhs.kind != rhs.kind) return false;
    switch (lhs.kind) {
        case Callers::Kind::Wildcard: return true;
        case Callers::Kind::Count:    return lhs.count == rhs.count;
        case Callers::Kind::List:     return lhs.names == rhs.names;
    }
    return false;
}


// ==================================================================
// Normalisation rules
// ==================================================================

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void extend_normalised(std::vector<std::string>* target,
                       const std::vector<std::string>& values) {
    std::set<std::string> seen;
    for (const auto& existing : *target) {
        seen.insert(to_lower(existing));
    }
    for (const auto& value : values) {
        std::string lowered = to_lower(value);
        if (seen.insert(lowered).second) {
            target->push_back(lowered);
        }
    }
}

void extend_flags(std::string* flags, const std::string& chars) {
    for (char ch : chars) {
        if (flags->find(ch) == std::string::npos) {
            flags->push_back(ch);
        }
    }
}

std::string normalise_flags(const std::vector<std::string>& values) {
    std::string out;
    for (const auto& value : values) {
        extend_flags(&out, value);
    }
    return out;
}


namespace {

// Longer digit runs would overflow long long; those stay caller names.
constexpr size_t kMaxCountDigits = 18;

bool is_count_literal(const std::string& s) {
    if (s.empty() || s.size() > kMaxCountDigits) return false;
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return c >= '0' && c <= '9'; });
}

}  // anonymous namespace


Callers parse_callers(const std::vector<std::string>& values) {
    if (values.empty()) {
        return Callers::wildcard();
    }
    if (values.size() == 1) {
        const std::string& v = values.front();
        if (v == "*") return Callers::wildcard();
        if (is_count_literal(v)) return Callers::of_count(std::stoll(v));
    }
    // Several values are always caller names, digits included.
    return Callers::of_names(values);
}

void extend_custom(CustomFields* into, const CustomFields& from) {
    for (const auto& kv : from) {
        auto& values = (*into)[kv.first];
        values.insert(values.end(), kv.second.begin(), kv.second.end());
    }
}


// ==================================================================
// JSON serialisation
// ==================================================================

void to_json(nlohmann::ordered_json& j, const Callers& c) {
    switch (c.kind) {
        case Callers::Kind::Wildcard:
            j = "*";
            break;
        case Callers::Kind::Count:
            j = c.count;
            break;
        case Callers::Kind::List:
            j = c.names;
            break;
    }
}

void to_json(nlohmann::ordered_json& j, const Record& r) {
    nlohmann::ordered_json custom = nlohmann::ordered_json::object();
    for (const auto& kv : r.custom) {
        custom[kv.first] = kv.second;
    }

    j = nlohmann::ordered_json::object();
    j["id"]          = r.id;
    j["symbol"]      = r.symbol;
    j["symbol_type"] = symbol_type_name(r.symbol_type);
    j["source_file"] = r.source_file;
    j["line_number"] = r.line_number;
    j["raw"]         = r.raw;
    j["doc"]         = r.doc;
    j["systems"]     = r.systems;
    j["roles"]       = r.roles;
    j["threads"]     = r.threads;
    j["callers"]     = r.callers;
    j["flags"]       = r.flags;
    j["assign_type"] = r.assign_type;
    j["custom"]      = std::move(custom);
}


// ==================================================================
// Strict inventory decoding
// ==================================================================

namespace {

const std::vector<std::string>& record_fields() {
    static const std::vector<std::string> fields = {
        "id", "symbol", "symbol_type", "source_file", "line_number",
        "raw", "doc", "systems", "roles", "threads",
        "callers", "flags", "assign_type", "custom",
    };
    return fields;
}

bool decode_string_list(const nlohmann::ordered_json& j,
                        const std::string& field,
                        std::vector<std::string>* out,
                        std::string* error) {
    if (!j.is_array()) {
        *error = field + " must be an array";
        return false;
    }
    out->clear();
    for (const auto& element : j) {
        if (!element.is_string()) {
            *error = field + " must contain only strings";
            return false;
        }
        out->push_back(element.get<std::string>());
    }
    return true;
}

bool decode_callers(const nlohmann::ordered_json& j, Callers* out, std::string* error) {
    if (j.is_string()) {
        if (j.get<std::string>() != "*") {
            *error = "callers string must be \"*\"";
            return false;
        }
        *out = Callers::wildcard();
        return true;
    }
    if (j.is_number_integer() && j.get<long long>() >= 0) {
        *out = Callers::of_count(j.get<long long>());
        return true;
    }
    if (j.is_array()) {
        std::vector<std::string> names;
        if (!decode_string_list(j, "callers", &names, error)) return false;
        *out = Callers::of_names(std::move(names));
        return true;
    }
    *error = "callers must be array | \"*\" | non-negative integer";
    return false;
}

}  // anonymous namespace


bool decode_record(const nlohmann::ordered_json& j, Record* out, std::string* error) {
    if (!j.is_object()) {
        *error = "inventory entry must be an object";
        return false;
    }

    const auto& fields = record_fields();
    for (const auto& field : fields) {
        if (!j.contains(field)) {
            *error = "inventory missing field: " + field;
            return false;
        }
    }
    for (const auto& item : j.items()) {
        if (std::find(fields.begin(), fields.end(), item.key()) == fields.end()) {
            *error = "inventory extra field: " + item.key();
            return false;
        }
    }

    Record r;

    for (const char* field : {"id", "symbol", "source_file", "flags", "assign_type"}) {
        if (!j.at(field).is_string()) {
            *error = std::string(field) + " must be a string";
            return false;
        }
    }
    r.id          = j.at("id").get<std::string>();
    r.symbol      = j.at("symbol").get<std::string>();
    r.source_file = j.at("source_file").get<std::string>();
    r.flags       = j.at("flags").get<std::string>();
    r.assign_type = j.at("assign_type").get<std::string>();

    const auto& type = j.at("symbol_type");
    if (!type.is_string() || !parse_symbol_type(type.get<std::string>(), &r.symbol_type)) {
        *error = "bad symbol_type: " + type.dump();
        return false;
    }

    const auto& line = j.at("line_number");
    if (!line.is_number_integer() || line.get<long long>() < 1 ||
        line.get<long long>() > std::numeric_limits<int>::max()) {
        *error = "line_number must be a positive integer";
        return false;
    }
    r.line_number = line.get<int>();

    if (!decode_string_list(j.at("raw"), "raw", &r.raw, error) ||
        !decode_string_list(j.at("doc"), "doc", &r.doc, error) ||
        !decode_string_list(j.at("systems"), "systems", &r.systems, error) ||
        !decode_string_list(j.at("roles"), "roles", &r.roles, error) ||
        !decode_string_list(j.at("threads"), "threads", &r.threads, error)) {
        return false;
    }

    if (!decode_callers(j.at("callers"), &r.callers, error)) {
        return false;
    }

    const auto& custom = j.at("custom");
    if (!custom.is_object()) {
        *error = "custom must be an object";
        return false;
    }
    for (const auto& item : custom.items()) {
        std::vector<std::string> values;
        if (!decode_string_list(item.value(), "custom." + item.key(), &values, error)) {
            return false;
        }
        r.custom[item.key()] = std::move(values);
    }

    *out = std::move(r);
    return true;
}

bool decode_inventory(const nlohmann::ordered_json& j,
                      std::vector<Record>* out,
                      std::string* error) {
    if (!j.is_array()) {
        *error = "inventory must be a JSON array";
        return false;
    }

    std::vector<Record> records;
    records.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        Record r;
        std::string entry_error;
        if (!decode_record(j[i], &r, &entry_error)) {
            *error = "inventory entry " + std::to_string(i) + ": " + entry_error;
            return false;
        }
        records.push_back(std::move(r));
    }

    *out = std::move(records);
    return true;
}

}  // namespace marginalia
