/**
 * @file scanner.h
 * @brief Per-file binding state machine, anchor merging and id resolution.
 *
 * Lines are streamed in file order through classify_line():
 *   - doc and meta lines accumulate into the pending Note (created on demand)
 *   - an anchor token drains the note into a new or existing anchor record
 *   - a declaration drains the note into a new record for that symbol
 *   - anything else leaves the pending note alone
 * A note still pending at end of file is reported as an orphan.
 *
 * All cursor state lives in a ScanContext owned by the caller.
 */

#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "declaration.h"
#include "events.h"
#include "meta_grammar.h"
#include "record.h"

namespace marginalia {

/// A record under construction. The locator fields of `record` are unset
/// until the note drains.
struct Note {
    Record record;
    int first_line = 0;              // line that opened the note
    bool callers_declared = false;   // a callers= token was seen
    bool has_explicit_id = false;    // a #id token was seen
};

struct ScanContext {
    std::string source_file;          // path relative to the scan root
    int line_number = 0;              // 1-based number of the current line
    std::optional<Note> pending;
    std::vector<Record>* inventory = nullptr;
    EventLog* events = nullptr;
};

enum class ScanStatus {
    Completed,
    Halted,      // the event log requested a stop while scanning this file
};

// ------------------------------------------------------------------
// Note accumulation
// ------------------------------------------------------------------

/// Add a doc line (raw text and payload) to the note.
void absorb_doc_line(Note* note, const std::string& raw, const std::string& payload);

/// Add a parsed meta line to the note. Anchor tokens are not handled here.
void absorb_meta_line(Note* note, const std::string& raw, const ParsedMeta& meta);

// ------------------------------------------------------------------
// Draining
// ------------------------------------------------------------------

/**
 * Finalise the pending note against an anchor of the current file.
 *
 * The most recently appended anchor record with the same source file and
 * name absorbs the note; without one, the note becomes a new anchor record
 * at the current line. Clears ctx->pending.
 */
void drain_to_anchor(ScanContext* ctx, const std::string& anchor);

/// Finalise the pending note as a new record for `decl` at the current
/// line. Clears ctx->pending.
void drain_to_symbol(ScanContext* ctx, const Declaration& decl);

/// Merge a drained note into an existing anchor record.
void merge_into_anchor(Record* existing, Note note, int line_number);

// ------------------------------------------------------------------
// Identity
// ------------------------------------------------------------------

/// "fn:" / "class:" / "var:" / "anchor:" + source_file:symbol:line_number.
/// Throws std::logic_error if a locator field is missing.
std::string derive_id(const Record& record);

/// Emit one duplicate-id event per record whose id an earlier record
/// already carries. Returns the number of duplicates found.
size_t check_duplicate_ids(const std::vector<Record>& inventory, EventLog* events);

// ------------------------------------------------------------------
// Scanning
// ------------------------------------------------------------------

/// Process one line in the context. Returns Halted if a diagnostic raised
/// by this line made the event log request a stop.
ScanStatus scan_line(ScanContext* ctx, const std::string& line);

/// Report and discard a note that is still pending at end of file.
void finish_file(ScanContext* ctx);

/// Scan a whole stream as the contents of `source_file`.
ScanStatus scan_stream(std::istream& in,
                       const std::string& source_file,
                       std::vector<Record>* inventory,
                       EventLog* events);

/// Open, scan and close `path`, reporting it as `source_file`.
ScanStatus scan_file(const std::string& path,
                     const std::string& source_file,
                     std::vector<Record>* inventory,
                     EventLog* events);

}  // namespace marginalia
