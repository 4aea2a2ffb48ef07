/**
 * @file cli_args.cpp
 * @brief Option matching for the CLI.
 */

#include "cli_args.h"

#include <string>
#include <vector>

namespace marginalia {

std::vector<std::string> split_globs(const std::string& value) {
    std::vector<std::string> globs;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        if (comma > start) {
            globs.push_back(value.substr(start, comma - start));
        }
        start = comma + 1;
    }
    return globs;
}

bool is_option(const std::string& arg, const std::string& name) {
    return arg == name || arg.compare(0, name.size() + 1, name + "=") == 0;
}

bool match_option(const std::string& arg, const std::string& name, std::string* value) {
    if (arg == name) {
        value->clear();
        return true;
    }
    if (arg.compare(0, name.size() + 1, name + "=") == 0) {
        *value = arg.substr(name.size() + 1);
        return true;
    }
    return false;
}

bool take_value(const std::string& arg, const std::string& name,
                int argc, char* argv[], int* i, std::string* value) {
    if (arg == name) {
        if (*i + 1 >= argc) return false;
        *value = argv[++*i];
        return true;
    }
    return match_option(arg, name, value);
}

}  // namespace marginalia
