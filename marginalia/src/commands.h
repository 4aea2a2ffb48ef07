/**
 * @file commands.h
 * @brief The "scan" and "indexes" commands behind the CLI.
 *
 * Options arrive already parsed; the commands run the pipeline, route the
 * artifacts and return the process exit code computed by the EventLog.
 */

#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "discovery.h"
#include "events.h"
#include "output.h"
#include "record.h"
#include "scanner.h"

namespace marginalia {

struct ScanOptions {
    std::string path;

    // Neither flag given means both artifacts are emitted.
    bool inventory_requested = false;
    bool indexes_requested = false;
    std::string inventory_dest;      // "", "stdout" or a file path
    std::string indexes_dest;

    JsonStyle style = JsonStyle::Compact;
    DiscoveryOptions discovery;
    bool filters_given = false;      // --files or --exclude was passed

    FailPolicy fail = FailPolicy::Warn;
    bool strict = false;
    bool quiet = false;              // hide [info] lines in the summary
};

struct IndexesOptions {
    std::string inventory_file;
    std::string indexes_dest;
    JsonStyle style = JsonStyle::Compact;
};

/// Resolved artifact destinations of a scan; `emit_*` false means skipped.
struct ScanRouting {
    bool emit_inventory = true;
    bool emit_indexes = true;
    Destination inventory;
    Destination indexes;
};

/// Apply the emit defaults and default paths. Fails if both artifacts
/// would go to standard output.
bool plan_scan_routing(const ScanOptions& options, ScanRouting* out, std::string* error);

/**
 * Scan `files` in order into `inventory`.
 *
 * The halt flag of `events` is checked after every file; scanning stops at
 * the first file that reports ScanStatus::Halted.
 */
ScanStatus scan_sources(const std::vector<SourceFile>& files,
                        std::vector<Record>* inventory,
                        EventLog* events);

/// marginalia scan. Artifacts routed to stdout go to `out`, the event
/// summary to `err`.
int run_scan_command(const ScanOptions& options,
                     EventLog* events,
                     std::ostream& out,
                     std::ostream& err);

/// marginalia indexes.
int run_indexes_command(const IndexesOptions& options,
                        EventLog* events,
                        std::ostream& out,
                        std::ostream& err);

}  // namespace marginalia
