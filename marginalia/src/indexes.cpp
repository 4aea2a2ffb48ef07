/**
 * @file indexes.cpp
 * @brief Pure projection of the inventory into lookup buckets.
 */

#include "indexes.h"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace marginalia {

bool KeyLess::operator()(const std::string& lhs, const std::string& rhs) const {
    const size_t n = std::min(lhs.size(), rhs.size());
    for (size_t i = 0; i < n; ++i) {
        int a = std::tolower(static_cast<unsigned char>(lhs[i]));
        int b = std::tolower(static_cast<unsigned char>(rhs[i]));
        if (a != b) return a < b;
    }
    if (lhs.size() != rhs.size()) return lhs.size() < rhs.size();
    return lhs < rhs;
}

std::vector<Record> sort_records(const std::vector<Record>& records) {
    struct Keyed {
        std::string symbol;
        std::string file;
        const Record* record;
    };

    std::vector<Keyed> keyed;
    keyed.reserve(records.size());
    for (const auto& r : records) {
        keyed.push_back(Keyed{to_lower(r.symbol), to_lower(r.source_file), &r});
    }

    std::stable_sort(keyed.begin(), keyed.end(), [](const Keyed& a, const Keyed& b) {
        if (a.symbol != b.symbol) return a.symbol < b.symbol;
        if (a.file != b.file) return a.file < b.file;
        return a.record->line_number < b.record->line_number;
    });

    std::vector<Record> sorted;
    sorted.reserve(keyed.size());
    for (const auto& k : keyed) {
        sorted.push_back(*k.record);
    }
    return sorted;
}

Indexes build_indexes(const std::vector<Record>& records) {
    Indexes out;
    std::map<std::string, int> symbol_counts;

    for (const auto& r : sort_records(records)) {
        int n = ++symbol_counts[r.symbol];
        std::string key = n == 1 ? r.symbol : r.symbol + " (" + std::to_string(n) + ")";
        out.by_symbol.emplace(key, r);

        out.by_file[r.source_file].push_back(r);
        for (const auto& system : r.systems) {
            out.by_module[system].push_back(r);
        }
        for (const auto& thread : r.threads) {
            out.by_thread[thread].push_back(r);
        }
        for (char flag : r.flags) {
            out.by_flag[std::string(1, flag)].push_back(r);
        }
    }
    return out;
}


namespace {

nlohmann::ordered_json buckets_to_json(const Buckets& buckets) {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& kv : buckets) {
        j[kv.first] = kv.second;
    }
    return j;
}

}  // anonymous namespace


void to_json(nlohmann::ordered_json& j, const Indexes& indexes) {
    nlohmann::ordered_json by_symbol = nlohmann::ordered_json::object();
    for (const auto& kv : indexes.by_symbol) {
        by_symbol[kv.first] = kv.second;
    }

    j = nlohmann::ordered_json::object();
    j["by-symbol"] = std::move(by_symbol);
    j["by-file"]   = buckets_to_json(indexes.by_file);
    j["by-module"] = buckets_to_json(indexes.by_module);
    j["by-thread"] = buckets_to_json(indexes.by_thread);
    j["by-flag"]   = buckets_to_json(indexes.by_flag);
}

}  // namespace marginalia
