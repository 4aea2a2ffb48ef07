/**
 * @file scanner.cpp
 * @brief Binding state machine: note accumulation, draining and anchor merges.
 */

#include "scanner.h"

#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "line_classifier.h"

namespace marginalia {

namespace {

std::string join(const std::vector<std::string>& values, const char* sep) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += sep;
        out += values[i];
    }
    return out;
}

std::string location(const ScanContext& ctx, int line) {
    return ctx.source_file + ":" + std::to_string(line);
}

Note& ensure_pending(ScanContext* ctx) {
    if (!ctx->pending) {
        ctx->pending.emplace();
        ctx->pending->first_line = ctx->line_number;
    }
    return *ctx->pending;
}

Note take_pending(ScanContext* ctx) {
    if (!ctx->pending) {
        throw std::logic_error("drain without a pending note at " +
                               location(*ctx, ctx->line_number));
    }
    Note note = std::move(*ctx->pending);
    ctx->pending.reset();
    return note;
}

}  // anonymous namespace


// ==================================================================
// Note accumulation
// ==================================================================

void absorb_doc_line(Note* note, const std::string& raw, const std::string& payload) {
    note->record.raw.push_back(raw);
    note->record.doc.push_back(payload);
}

void absorb_meta_line(Note* note, const std::string& raw, const ParsedMeta& meta) {
    Record& r = note->record;
    r.raw.push_back(raw);

    for (const auto& kv : meta.reserved) {
        const std::string& key = kv.first;
        const std::vector<std::string>& values = kv.second;

        if (key == "systems") {
            extend_normalised(&r.systems, values);
        } else if (key == "roles") {
            extend_normalised(&r.roles, values);
        } else if (key == "threads") {
            extend_normalised(&r.threads, values);
        } else if (key == "callers") {
            // "callers=" on its own still declares the field
            r.callers = parse_callers(values);
            note->callers_declared = true;
        } else if (key == "flags") {
            // Flags from every contributing line, first appearance first.
            extend_flags(&r.flags, normalise_flags(values));
        } else if (key == "assign_type") {
            if (!values.empty()) {
                r.assign_type = join(values, ",");
            }
        }
    }

    extend_custom(&r.custom, meta.custom);

    if (meta.has_explicit_id()) {
        r.id = meta.explicit_id;
        note->has_explicit_id = true;
    }
}


// ==================================================================
// Draining
// ==================================================================

void merge_into_anchor(Record* existing, Note note, int line_number) {
    Record& incoming = note.record;

    existing->raw.insert(existing->raw.end(), incoming.raw.begin(), incoming.raw.end());
    existing->doc.insert(existing->doc.end(), incoming.doc.begin(), incoming.doc.end());

    extend_normalised(&existing->systems, incoming.systems);
    extend_normalised(&existing->roles, incoming.roles);
    extend_normalised(&existing->threads, incoming.threads);

    if (note.callers_declared) {
        existing->callers = incoming.callers;
    }
    extend_flags(&existing->flags, incoming.flags);
    if (!incoming.assign_type.empty()) {
        existing->assign_type = incoming.assign_type;
    }
    extend_custom(&existing->custom, incoming.custom);

    existing->line_number = line_number;

    if (note.has_explicit_id) {
        existing->id = incoming.id;
    } else if (existing->id.empty()) {
        existing->id = derive_id(*existing);
    }
}

void drain_to_anchor(ScanContext* ctx, const std::string& anchor) {
    Note note = take_pending(ctx);
    std::vector<Record>& inventory = *ctx->inventory;

    for (auto it = inventory.rbegin(); it != inventory.rend(); ++it) {
        if (it->symbol_type == SymbolType::Anchor &&
            it->symbol == anchor &&
            it->source_file == ctx->source_file) {
            merge_into_anchor(&*it, std::move(note), ctx->line_number);
            return;
        }
    }

    Record r = std::move(note.record);
    r.symbol = anchor;
    r.symbol_type = SymbolType::Anchor;
    r.source_file = ctx->source_file;
    r.line_number = ctx->line_number;
    if (!note.has_explicit_id) {
        r.id = derive_id(r);
    }
    inventory.push_back(std::move(r));
}

void drain_to_symbol(ScanContext* ctx, const Declaration& decl) {
    Note note = take_pending(ctx);

    Record r = std::move(note.record);
    r.symbol = decl.symbol;
    r.symbol_type = decl.type;
    r.source_file = ctx->source_file;
    r.line_number = ctx->line_number;
    if (!note.has_explicit_id) {
        r.id = derive_id(r);
    }
    ctx->inventory->push_back(std::move(r));
}


// ==================================================================
// Identity
// ==================================================================

std::string derive_id(const Record& record) {
    if (record.symbol.empty() || record.source_file.empty() || record.line_number < 1) {
        throw std::logic_error("cannot derive id: record locator is incomplete (symbol='" +
                               record.symbol + "', source_file='" + record.source_file +
                               "', line_number=" + std::to_string(record.line_number) + ")");
    }

    const char* prefix = "";
    switch (record.symbol_type) {
        case SymbolType::Function: prefix = "fn:";     break;
        case SymbolType::Class:    prefix = "class:";  break;
        case SymbolType::Variable: prefix = "var:";    break;
        case SymbolType::Anchor:   prefix = "anchor:"; break;
    }
    return prefix + record.source_file + ":" + record.symbol + ":" +
           std::to_string(record.line_number);
}

size_t check_duplicate_ids(const std::vector<Record>& inventory, EventLog* events) {
    std::map<std::string, size_t> seen;
    size_t duplicates = 0;

    for (size_t i = 0; i < inventory.size(); ++i) {
        const Record& r = inventory[i];
        auto inserted = seen.emplace(r.id, i);
        if (inserted.second) {
            continue;
        }

        const size_t first_i = inserted.first->second;
        const Record& first = inventory[first_i];
        ++duplicates;

        nlohmann::ordered_json data = nlohmann::ordered_json::object();
        data["id"] = r.id;
        data["first_i"] = first_i;
        data["i"] = i;
        events->append(
            event_kind::kDuplicateId,
            "duplicate id '" + r.id + "': " +
                first.source_file + ":" + std::to_string(first.line_number) + " (" + first.symbol + ") and " +
                r.source_file + ":" + std::to_string(r.line_number) + " (" + r.symbol + ")",
            std::move(data));
    }
    return duplicates;
}


// ==================================================================
// Scanning
// ==================================================================

ScanStatus scan_line(ScanContext* ctx, const std::string& line) {
    ClassifiedLine classified = classify_line(line);

    switch (classified.kind) {
        case LineKind::Doc:
            absorb_doc_line(&ensure_pending(ctx), line, classified.doc_text);
            break;

        case LineKind::Meta: {
            ParsedMeta meta;
            std::string error;
            if (!parse_meta_line(line, &meta, &error)) {
                nlohmann::ordered_json data = nlohmann::ordered_json::object();
                data["file"] = ctx->source_file;
                data["line"] = ctx->line_number;
                data["error"] = error;
                data["text"] = line;
                ctx->events->append(event_kind::kMetaGrammarError,
                                    location(*ctx, ctx->line_number) + ": " + error,
                                    std::move(data));
                return ctx->events->halt_requested() ? ScanStatus::Halted
                                                     : ScanStatus::Completed;
            }
            absorb_meta_line(&ensure_pending(ctx), line, meta);
            if (meta.has_anchor()) {
                drain_to_anchor(ctx, meta.anchor);
            }
            break;
        }

        case LineKind::Declaration:
            // A bare declaration with nothing pending is not an error.
            if (ctx->pending) {
                drain_to_symbol(ctx, classified.declaration);
            }
            break;

        case LineKind::Skippable:
        case LineKind::Other:
            break;
    }
    return ScanStatus::Completed;
}

void finish_file(ScanContext* ctx) {
    if (!ctx->pending) {
        return;
    }

    const Note& note = *ctx->pending;
    nlohmann::ordered_json data = nlohmann::ordered_json::object();
    data["file"] = ctx->source_file;
    data["line"] = note.first_line;
    data["raw"] = note.record.raw;
    ctx->events->append(event_kind::kOrphanNote,
                        location(*ctx, note.first_line) +
                            ": meta note never bound (end of file reached)",
                        std::move(data));
    ctx->pending.reset();
}

ScanStatus scan_stream(std::istream& in,
                       const std::string& source_file,
                       std::vector<Record>* inventory,
                       EventLog* events) {
    ScanContext ctx;
    ctx.source_file = source_file;
    ctx.inventory = inventory;
    ctx.events = events;

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        ++ctx.line_number;
        if (scan_line(&ctx, line) == ScanStatus::Halted) {
            return ScanStatus::Halted;
        }
    }

    finish_file(&ctx);
    return events->halt_requested() ? ScanStatus::Halted : ScanStatus::Completed;
}

ScanStatus scan_file(const std::string& path,
                     const std::string& source_file,
                     std::vector<Record>* inventory,
                     EventLog* events) {
    std::ifstream in(path);
    if (!in.is_open()) {
        nlohmann::ordered_json data = nlohmann::ordered_json::object();
        data["path"] = path;
        events->append(event_kind::kFileUnreadable, "cannot open " + path, std::move(data));
        return events->halt_requested() ? ScanStatus::Halted : ScanStatus::Completed;
    }

    ScanStatus status = scan_stream(in, source_file, inventory, events);
    if (in.bad()) {
        nlohmann::ordered_json data = nlohmann::ordered_json::object();
        data["path"] = path;
        events->append(event_kind::kFileUnreadable, "read error in " + path, std::move(data));
        if (events->halt_requested()) {
            status = ScanStatus::Halted;
        }
    }
    return status;
}

}  // namespace marginalia
