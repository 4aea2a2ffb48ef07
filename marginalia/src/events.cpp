/**
 * @file events.cpp
 * @brief Event catalog, fail policy and presentation.
 */

#include "events.h"

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace marginalia {

namespace {

const EventKindSpec kEventKinds[] = {
    {event_kind::kMetaGrammarError, EventLevel::Error,   "schema"},
    {event_kind::kOrphanNote,       EventLevel::Warning, "schema"},
    {event_kind::kDuplicateId,      EventLevel::Info,    ""},
    {event_kind::kFileUnreadable,   EventLevel::Error,   "io"},
    {event_kind::kPathDoesNotExist, EventLevel::Error,   "usage"},
    {event_kind::kFilterIgnored,    EventLevel::Warning, "usage"},
    {event_kind::kWriteFailed,      EventLevel::Error,   "io"},
    {event_kind::kInventoryInvalid, EventLevel::Error,   "schema"},
};

}  // anonymous namespace


bool parse_fail_policy(const std::string& text, FailPolicy* out) {
    if (text == "warn") {
        *out = FailPolicy::Warn;
        return true;
    }
    if (text == "halt") {
        *out = FailPolicy::Halt;
        return true;
    }
    return false;
}

const char* event_level_name(EventLevel level) {
    switch (level) {
        case EventLevel::Info:    return "info";
        case EventLevel::Warning: return "warning";
        case EventLevel::Error:   return "error";
    }
    return "info";
}

const EventKindSpec* find_event_kind(const std::string& kind) {
    for (const auto& spec : kEventKinds) {
        if (kind == spec.kind) {
            return &spec;
        }
    }
    return nullptr;
}


// ==================================================================
// EventLog
// ==================================================================

const Event& EventLog::append(const std::string& kind,
                              const std::string& msg,
                              nlohmann::ordered_json data) {
    const EventKindSpec* spec = find_event_kind(kind);
    if (spec == nullptr) {
        throw std::logic_error("unknown event kind: " + kind);
    }

    Event e;
    e.level = spec->level;
    e.kind = kind;
    e.err = spec->err;
    e.msg = msg;
    e.data = std::move(data);
    events_.push_back(std::move(e));

    const Event& added = events_.back();
    if (policy_ == FailPolicy::Halt && effective_level(added) == EventLevel::Error) {
        stop_requested_ = true;
    }
    return added;
}

size_t EventLog::count(const std::string& kind) const {
    size_t n = 0;
    for (const auto& e : events_) {
        if (e.kind == kind) ++n;
    }
    return n;
}

EventLevel EventLog::effective_level(const Event& e) const {
    if (strict_ && e.level == EventLevel::Warning) {
        return EventLevel::Error;
    }
    return e.level;
}

int EventLog::exit_code() const {
    if (stop_requested_ && policy_ == FailPolicy::Halt) {
        return 3;
    }

    bool has_error = false;
    bool has_usage = false;
    bool has_schema = false;
    bool has_io = false;
    bool has_internal = false;

    for (const auto& e : events_) {
        if (effective_level(e) != EventLevel::Error) {
            continue;
        }
        has_error = true;
        if (e.err == "usage")         has_usage = true;
        else if (e.err == "schema")   has_schema = true;
        else if (e.err == "io")       has_io = true;
        else if (e.err == "internal") has_internal = true;
    }

    if (has_internal) return 5;
    if (has_usage)    return 1;
    if (has_schema)   return 2;
    if (has_io)       return 4;
    if (has_error && policy_ == FailPolicy::Halt) return 3;
    return 0;
}

std::vector<std::string> EventLog::presentation_lines(bool include_info) const {
    std::vector<std::string> out;

    for (const auto& e : events_) {
        EventLevel level = effective_level(e);
        if (level == EventLevel::Info && !include_info) {
            continue;
        }

        std::string prefix;
        switch (level) {
            case EventLevel::Info:    prefix = "[info]"; break;
            case EventLevel::Warning: prefix = "[warn]"; break;
            case EventLevel::Error:   prefix = "[err]";  break;
        }
        const std::string indent(prefix.size() + 1, ' ');

        std::istringstream lines(e.msg);
        std::string line;
        bool first = true;
        while (std::getline(lines, line)) {
            out.push_back((first ? prefix + " " : indent) + line);
            first = false;
        }
        if (first) {
            out.push_back(prefix);
        }
    }
    return out;
}

}  // namespace marginalia
