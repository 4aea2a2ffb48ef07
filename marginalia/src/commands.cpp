/**
 * @file commands.cpp
 * @brief Orchestration of discovery, scanning, indexing and emission.
 */

#include "commands.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "indexes.h"

namespace fs = std::filesystem;

namespace marginalia {

namespace {

void print_summary(const EventLog& events, bool include_info, std::ostream& err) {
    for (const auto& line : events.presentation_lines(include_info)) {
        err << line << "\n";
    }
}

std::string sibling_path(const std::string& file, const char* name) {
    fs::path parent = fs::path(file).parent_path();
    return (parent / name).string();
}

}  // anonymous namespace


bool plan_scan_routing(const ScanOptions& options, ScanRouting* out, std::string* error) {
    ScanRouting routing;
    if (options.inventory_requested || options.indexes_requested) {
        routing.emit_inventory = options.inventory_requested;
        routing.emit_indexes = options.indexes_requested;
    }

    const fs::path base(scan_base_dir(options.path));
    if (routing.emit_inventory) {
        routing.inventory = route(options.inventory_dest, (base / "inventory.json").string());
    }
    if (routing.emit_indexes) {
        routing.indexes = route(options.indexes_dest, (base / "indexes.json").string());
    }

    if (routing.emit_inventory && routing.emit_indexes &&
        routing.inventory.to_stdout && routing.indexes.to_stdout) {
        *error = "at most one output may be routed to stdout per invocation";
        return false;
    }

    *out = std::move(routing);
    return true;
}

ScanStatus scan_sources(const std::vector<SourceFile>& files,
                        std::vector<Record>* inventory,
                        EventLog* events) {
    for (const auto& file : files) {
        if (scan_file(file.path, file.source_file, inventory, events) == ScanStatus::Halted ||
            events->halt_requested()) {
            return ScanStatus::Halted;
        }
    }
    return ScanStatus::Completed;
}

int run_scan_command(const ScanOptions& options,
                     EventLog* events,
                     std::ostream& out,
                     std::ostream& err) {
    ScanRouting routing;
    std::string error;
    if (!plan_scan_routing(options, &routing, &error)) {
        err << "marginalia: usage error: " << error << "\n";
        return 1;
    }

    std::vector<SourceFile> files;
    if (!discover_source_files(options.path, options.discovery, &files, &error)) {
        nlohmann::ordered_json data = nlohmann::ordered_json::object();
        data["path"] = options.path;
        events->append(event_kind::kPathDoesNotExist, error, std::move(data));
        print_summary(*events, !options.quiet, err);
        return events->exit_code();
    }

    std::error_code ec;
    if (options.filters_given && !fs::is_directory(options.path, ec)) {
        nlohmann::ordered_json data = nlohmann::ordered_json::object();
        data["path"] = options.path;
        events->append(event_kind::kFilterIgnored,
                       "--files/--exclude have no effect when scanning a single file",
                       std::move(data));
    }

    std::vector<Record> inventory;
    ScanStatus status = scan_sources(files, &inventory, events);

    if (status == ScanStatus::Completed) {
        check_duplicate_ids(inventory, events);

        if (routing.emit_inventory) {
            nlohmann::ordered_json j = inventory;
            emit_json(j, routing.inventory, options.style, out, events);
        }
        if (routing.emit_indexes) {
            nlohmann::ordered_json j = build_indexes(inventory);
            emit_json(j, routing.indexes, options.style, out, events);
        }
    }

    print_summary(*events, !options.quiet, err);
    return events->exit_code();
}

int run_indexes_command(const IndexesOptions& options,
                        EventLog* events,
                        std::ostream& out,
                        std::ostream& err) {
    std::ifstream in(options.inventory_file);
    if (!in.is_open()) {
        nlohmann::ordered_json data = nlohmann::ordered_json::object();
        data["path"] = options.inventory_file;
        events->append(event_kind::kFileUnreadable,
                       "cannot open " + options.inventory_file, std::move(data));
        print_summary(*events, true, err);
        return events->exit_code();
    }

    std::vector<Record> inventory;
    std::string error;
    bool decoded = false;
    try {
        nlohmann::ordered_json j = nlohmann::ordered_json::parse(in);
        decoded = decode_inventory(j, &inventory, &error);
    } catch (const nlohmann::ordered_json::parse_error& e) {
        error = e.what();
    }

    if (!decoded) {
        nlohmann::ordered_json data = nlohmann::ordered_json::object();
        data["path"] = options.inventory_file;
        events->append(event_kind::kInventoryInvalid,
                       options.inventory_file + ": " + error, std::move(data));
        print_summary(*events, true, err);
        return events->exit_code();
    }

    Destination dest = route(options.indexes_dest,
                             sibling_path(options.inventory_file, "indexes.json"));
    nlohmann::ordered_json j = build_indexes(inventory);
    emit_json(j, dest, options.style, out, events);

    print_summary(*events, true, err);
    return events->exit_code();
}

}  // namespace marginalia
