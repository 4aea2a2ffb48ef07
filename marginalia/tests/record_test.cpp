#include "record.h"
#include <gtest/gtest.h>

using namespace marginalia;
using json = nlohmann::ordered_json;

namespace {

Record sample_record() {
    Record r;
    r.id = "fn:pkg/mod.py:foo:2";
    r.symbol = "foo";
    r.symbol_type = SymbolType::Function;
    r.source_file = "pkg/mod.py";
    r.line_number = 2;
    r.raw = {"# meta: modules=db callers=1 flags=D#X"};
    r.systems = {"db"};
    r.callers = Callers::of_count(1);
    r.flags = "D#X";
    r.custom["writers"] = {"scan", "db"};
    return r;
}

}  // namespace

// Normalisation
TEST(RecordNormalisationTest, ListsAreLoweredAndDeduplicated) {
    std::vector<std::string> systems;
    extend_normalised(&systems, {"DB", "Conversation", "db"});
    EXPECT_EQ(systems, (std::vector<std::string>{"db", "conversation"}));

    extend_normalised(&systems, {"CONVERSATION", "io"});
    EXPECT_EQ(systems, (std::vector<std::string>{"db", "conversation", "io"}));
}

TEST(RecordNormalisationTest, FlagsKeepFirstOccurrence) {
    EXPECT_EQ(normalise_flags({"aab"}), "ab");
    EXPECT_EQ(normalise_flags({"a", "b", "A"}), "abA");
    EXPECT_EQ(normalise_flags({}), "");

    std::string flags = "ab";
    extend_flags(&flags, "cba");
    EXPECT_EQ(flags, "abc");
}

TEST(RecordNormalisationTest, CallersParsing) {
    EXPECT_EQ(parse_callers({}), Callers::wildcard());
    EXPECT_EQ(parse_callers({"*"}), Callers::wildcard());
    EXPECT_EQ(parse_callers({"3"}), Callers::of_count(3));
    EXPECT_EQ(parse_callers({"0"}), Callers::of_count(0));
    EXPECT_EQ(parse_callers({"foo"}), Callers::of_names({"foo"}));
    EXPECT_EQ(parse_callers({"foo", "bar"}), Callers::of_names({"foo", "bar"}));
    EXPECT_EQ(parse_callers({"1", "2"}), Callers::of_names({"1", "2"}));
    EXPECT_EQ(parse_callers({"Foo.Bar"}), Callers::of_names({"Foo.Bar"}));
    EXPECT_EQ(parse_callers({"99999999999999999999"}),
              Callers::of_names({"99999999999999999999"}));
}

TEST(RecordNormalisationTest, CustomValuesAccumulate) {
    CustomFields custom;
    custom["writers"] = {"a"};
    extend_custom(&custom, {{"writers", {"a", "b"}}, {"readers", {"*"}}});
    EXPECT_EQ(custom["writers"], (std::vector<std::string>{"a", "a", "b"}));
    EXPECT_EQ(custom["readers"], (std::vector<std::string>{"*"}));
}

TEST(RecordNormalisationTest, SymbolTypeNames) {
    for (auto type : {SymbolType::Function, SymbolType::Class, SymbolType::Variable, SymbolType::Anchor}) {
        SymbolType parsed = SymbolType::Function;
        ASSERT_TRUE(parse_symbol_type(symbol_type_name(type), &parsed));
        EXPECT_EQ(parsed, type);
    }
    SymbolType parsed = SymbolType::Function;
    EXPECT_FALSE(parse_symbol_type("var", &parsed));
}

// JSON
TEST(RecordJsonTest, SerialisesExactlyTheRecordFields) {
    json j = sample_record();

    std::vector<std::string> keys;
    for (const auto& item : j.items()) {
        keys.push_back(item.key());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{
        "id", "symbol", "symbol_type", "source_file", "line_number", "raw", "doc",
        "systems", "roles", "threads", "callers", "flags", "assign_type", "custom"}));

    EXPECT_EQ(j["symbol_type"].get<std::string>(), "function");
    EXPECT_EQ(j["callers"].get<long long>(), 1);
    EXPECT_EQ(j["flags"].get<std::string>(), "D#X");
    EXPECT_EQ(j["custom"]["writers"], json::array({"scan", "db"}));
}

TEST(RecordJsonTest, CallersShapes) {
    EXPECT_EQ(json(Callers::wildcard()).get<std::string>(), "*");
    EXPECT_EQ(json(Callers::of_count(7)).get<long long>(), 7);
    EXPECT_EQ(json(Callers::of_names({"a", "b"})), json::array({"a", "b"}));
}

TEST(RecordJsonTest, DecodeAcceptsSerialisedRecord) {
    Record written = sample_record();
    json j = json::parse(json(written).dump());

    Record decoded;
    std::string error;
    ASSERT_TRUE(decode_record(j, &decoded, &error)) << error;
    EXPECT_EQ(decoded.id, written.id);
    EXPECT_EQ(decoded.symbol_type, SymbolType::Function);
    EXPECT_EQ(decoded.line_number, 2);
    EXPECT_EQ(decoded.callers, Callers::of_count(1));
    EXPECT_EQ(decoded.custom, written.custom);
}

TEST(RecordJsonTest, DecodeRejectsMissingAndExtraFields) {
    json j = sample_record();
    Record decoded;
    std::string error;

    json missing = j;
    missing.erase("doc");
    EXPECT_FALSE(decode_record(missing, &decoded, &error));
    EXPECT_EQ(error, "inventory missing field: doc");

    json extra = j;
    extra["modules"] = json::array();
    EXPECT_FALSE(decode_record(extra, &decoded, &error));
    EXPECT_EQ(error, "inventory extra field: modules");
}

TEST(RecordJsonTest, DecodeRejectsBadTypes) {
    json j = sample_record();
    Record decoded;
    std::string error;

    json bad_type = j;
    bad_type["symbol_type"] = "data";
    EXPECT_FALSE(decode_record(bad_type, &decoded, &error));

    json bad_callers = j;
    bad_callers["callers"] = "any";
    EXPECT_FALSE(decode_record(bad_callers, &decoded, &error));

    json negative_callers = j;
    negative_callers["callers"] = -1;
    EXPECT_FALSE(decode_record(negative_callers, &decoded, &error));

    json bad_line = j;
    bad_line["line_number"] = 0;
    EXPECT_FALSE(decode_record(bad_line, &decoded, &error));

    json bad_flags = j;
    bad_flags["flags"] = json::array({"a"});
    EXPECT_FALSE(decode_record(bad_flags, &decoded, &error));
    EXPECT_EQ(error, "flags must be a string");
}

TEST(RecordJsonTest, DecodeInventoryReportsEntryIndex) {
    json inventory = json::array({json(sample_record()), json::object()});
    std::vector<Record> records;
    std::string error;
    EXPECT_FALSE(decode_inventory(inventory, &records, &error));
    EXPECT_EQ(error, "inventory entry 1: inventory missing field: id");

    EXPECT_FALSE(decode_inventory(json::object(), &records, &error));
    EXPECT_EQ(error, "inventory must be a JSON array");
}
