/**
 * @file events.h
 * @brief Structured diagnostics, the fail policy and exit code computation.
 *
 * Every user-facing problem found while scanning or emitting is recorded as
 * an Event drawn from a fixed catalog of kinds. The EventLog decides, per
 * the fail policy, whether an event requests a stop; the scanner and the
 * driver poll halt_requested() between units of work.
 *
 * Exit codes:
 *   0  success (or only non-fatal events)
 *   1  usage or argument error
 *   2  parse or schema error
 *   3  fail policy halt
 *   4  filesystem or IO error
 *   5  internal error
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace marginalia {

enum class EventLevel {
    Info,
    Warning,
    Error,
};

enum class FailPolicy {
    Warn,    // report and carry on
    Halt,    // the first error-level event stops the run
};

/// Parse "warn" / "halt". Returns false for anything else.
bool parse_fail_policy(const std::string& text, FailPolicy* out);

const char* event_level_name(EventLevel level);

// ------------------------------------------------------------------
// Event catalog
// ------------------------------------------------------------------

namespace event_kind {
constexpr const char* kMetaGrammarError   = "meta-grammar-error";
constexpr const char* kOrphanNote         = "orphan-note";
constexpr const char* kDuplicateId        = "duplicate-id";
constexpr const char* kFileUnreadable     = "file-unreadable";
constexpr const char* kPathDoesNotExist   = "path-does-not-exist";
constexpr const char* kFilterIgnored      = "filter-ignored-for-file";
constexpr const char* kWriteFailed        = "write-failed";
constexpr const char* kInventoryInvalid   = "inventory-invalid";
}  // namespace event_kind

struct EventKindSpec {
    const char* kind;
    EventLevel level;
    const char* err;             // "", "usage", "schema", "io", "internal"
};

/// Catalog entry for `kind`, or nullptr if the kind is unknown.
const EventKindSpec* find_event_kind(const std::string& kind);

struct Event {
    EventLevel level = EventLevel::Info;
    std::string kind;
    std::string err;
    std::string msg;
    nlohmann::ordered_json data;
};

// ------------------------------------------------------------------
// Event log
// ------------------------------------------------------------------

class EventLog {
public:
    explicit EventLog(FailPolicy policy = FailPolicy::Warn, bool strict = false)
        : policy_(policy), strict_(strict) {}

    /// Record an event of a catalog kind. Throws std::logic_error for a
    /// kind that is not in the catalog.
    const Event& append(const std::string& kind,
                        const std::string& msg,
                        nlohmann::ordered_json data = nlohmann::ordered_json::object());

    bool halt_requested() const { return stop_requested_; }
    const std::vector<Event>& events() const { return events_; }
    size_t count(const std::string& kind) const;

    /// Level after the strict option is applied (warnings become errors).
    EventLevel effective_level(const Event& e) const;

    int exit_code() const;

    /// One "[info] / [warn] / [err]" line per event line; continuation lines
    /// of multi-line messages are indented under the first.
    std::vector<std::string> presentation_lines(bool include_info = true) const;

private:
    FailPolicy policy_;
    bool strict_;
    bool stop_requested_ = false;
    std::vector<Event> events_;
};

}  // namespace marginalia
