/**
 * @file main.cpp
 * @brief CLI entry point for marginalia.
 *
 * Usage:
 *   marginalia scan <path> [--inventory[=DEST]] [--indexes[=DEST]]
 *                          [--pretty | --compact] [--files GLOBS] [--exclude GLOBS]
 *                          [--fail warn|halt] [--strict] [--quiet]
 *   marginalia indexes <inventory.json> [--indexes[=DEST]] [--pretty | --compact]
 *   marginalia --version
 *
 * DEST is a file path or "stdout". GLOBS is a comma-separated list.
 * Artifacts routed to stdout are written there; the event summary and
 * errors go to stderr.
 */

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli_args.h"
#include "commands.h"

#ifndef MARGINALIA_VERSION
#define MARGINALIA_VERSION "0.0.0"
#endif

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " scan <path>"
        << " [--inventory[=DEST]] [--indexes[=DEST]]"
        << " [--pretty|--compact] [--files GLOBS] [--exclude GLOBS]"
        << " [--fail warn|halt] [--strict] [--quiet]\n"
        << "       " << prog << " indexes <inventory.json>"
        << " [--indexes[=DEST]] [--pretty|--compact]\n"
        << "       " << prog << " --version\n";
}

static int run_scan(int argc, char* argv[]) {
    marginalia::ScanOptions options;
    bool pretty = false;
    bool compact = false;

    // --- Parse CLI arguments ---
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;

        if (marginalia::match_option(arg, "--inventory", &value)) {
            options.inventory_requested = true;
            options.inventory_dest = value;
        } else if (marginalia::match_option(arg, "--indexes", &value)) {
            options.indexes_requested = true;
            options.indexes_dest = value;
        } else if (arg == "--pretty") {
            pretty = true;
        } else if (arg == "--compact") {
            compact = true;
        } else if (arg == "--strict") {
            options.strict = true;
        } else if (arg == "--quiet") {
            options.quiet = true;
        } else if (marginalia::is_option(arg, "--files")) {
            if (!marginalia::take_value(arg, "--files", argc, argv, &i, &value) ||
                marginalia::split_globs(value).empty()) {
                std::cerr << "Error: --files requires a glob list\n";
                return 1;
            }
            options.discovery.include_globs = marginalia::split_globs(value);
            options.filters_given = true;
        } else if (marginalia::is_option(arg, "--exclude")) {
            if (!marginalia::take_value(arg, "--exclude", argc, argv, &i, &value) ||
                marginalia::split_globs(value).empty()) {
                std::cerr << "Error: --exclude requires a glob list\n";
                return 1;
            }
            options.discovery.exclude_names = marginalia::split_globs(value);
            options.filters_given = true;
        } else if (marginalia::is_option(arg, "--fail")) {
            if (!marginalia::take_value(arg, "--fail", argc, argv, &i, &value) ||
                !marginalia::parse_fail_policy(value, &options.fail)) {
                std::cerr << "Error: --fail must be 'warn' or 'halt'\n";
                return 1;
            }
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && options.path.empty()) {
            options.path = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // --- Validate ---
    if (options.path.empty()) {
        std::cerr << "Error: scan requires a path\n";
        print_usage(argv[0]);
        return 1;
    }
    if (pretty && compact) {
        std::cerr << "Error: cannot combine --pretty and --compact\n";
        return 1;
    }
    options.style = pretty ? marginalia::JsonStyle::Pretty : marginalia::JsonStyle::Compact;

    // --- Run scan ---
    marginalia::EventLog events(options.fail, options.strict);
    return marginalia::run_scan_command(options, &events, std::cout, std::cerr);
}

static int run_indexes(int argc, char* argv[]) {
    marginalia::IndexesOptions options;
    bool pretty = false;
    bool compact = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;

        if (marginalia::match_option(arg, "--indexes", &value)) {
            options.indexes_dest = value;
        } else if (arg == "--pretty") {
            pretty = true;
        } else if (arg == "--compact") {
            compact = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && options.inventory_file.empty()) {
            options.inventory_file = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (options.inventory_file.empty()) {
        std::cerr << "Error: indexes requires an inventory file\n";
        print_usage(argv[0]);
        return 1;
    }
    if (pretty && compact) {
        std::cerr << "Error: cannot combine --pretty and --compact\n";
        return 1;
    }
    options.style = pretty ? marginalia::JsonStyle::Pretty : marginalia::JsonStyle::Compact;

    marginalia::EventLog events;
    return marginalia::run_indexes_command(options, &events, std::cout, std::cerr);
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--version") {
        std::cout << "marginalia " << MARGINALIA_VERSION << std::endl;
        return 0;
    }
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    // Internal invariant violations surface as std::logic_error.
    try {
        if (command == "scan") {
            return run_scan(argc, argv);
        }
        if (command == "indexes") {
            return run_indexes(argc, argv);
        }
    } catch (const std::logic_error& e) {
        std::cerr << "marginalia: internal error: " << e.what() << "\n";
        return 5;
    }

    std::cerr << "Error: unknown command '" << command << "'\n";
    print_usage(argv[0]);
    return 1;
}
