/**
 * @file indexes.h
 * @brief Grouped lookup views derived from a finalized inventory.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "record.h"

namespace marginalia {

/// Case-insensitive ordering; keys equal ignoring case fall back to plain
/// byte order so the ordering stays total.
struct KeyLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

using Buckets = std::map<std::string, std::vector<Record>, KeyLess>;

struct Indexes {
    std::map<std::string, Record, KeyLess> by_symbol;
    Buckets by_file;
    Buckets by_module;
    Buckets by_thread;
    Buckets by_flag;
};

/// Stable sort by (lowercase symbol, lowercase source_file, line_number).
std::vector<Record> sort_records(const std::vector<Record>& records);

/**
 * Build every index from `records`.
 *
 * by_symbol holds the first record of each symbol under the symbol itself
 * and the n-th (n >= 2, in sorted order) under "<symbol> (<n>)". The other
 * views map each key to the records carrying it, in sorted order.
 */
Indexes build_indexes(const std::vector<Record>& records);

/// {"by-symbol", "by-file", "by-module", "by-thread", "by-flag"}
void to_json(nlohmann::ordered_json& j, const Indexes& indexes);

}  // namespace marginalia
