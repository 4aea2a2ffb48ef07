/**
 * @file cli_args.h
 * @brief Small helpers for the hand-written argv loop in main.cpp.
 */

#pragma once

#include <string>
#include <vector>

namespace marginalia {

/// Split a comma-separated glob list, dropping empty entries.
std::vector<std::string> split_globs(const std::string& value);

/// True if `arg` is exactly `name` or starts with "name=".
bool is_option(const std::string& arg, const std::string& name);

/// "--name=value" -> true and value; "--name" -> true and "".
bool match_option(const std::string& arg, const std::string& name, std::string* value);

/// Value of an option that requires one, given as "--name=value" or
/// "--name value". Advances `*i` past a separate value argument.
bool take_value(const std::string& arg, const std::string& name,
                int argc, char* argv[], int* i, std::string* value);

}  // namespace marginalia
