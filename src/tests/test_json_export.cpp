#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "test_helpers.h"
#include "daesa_json_export.h"
#include <string>

using json = nlohmann::json;

// Helper: parse script string and return JSON IR
static json documentToJson(const std::string& script) {
    Daesa::Parser parser;
    EXPECT_TRUE(parser.parseString(script));
    return Daesa::JsonExport::toJson(parser.getDocument());
}

static json treeToJson(const std::string& script) {
    return Daesa::JsonExport::treeToJson(
        Daesa::TreeBuilder::build(DaesaTest::parseScript(script)));
}

// ============================================================
// Document IR
// ============================================================

TEST(JsonExportTest, BasicStructure) {
    auto j = documentToJson("%START%\n|SAY| hi\n%END%\n");

    EXPECT_EQ(j["format"], "daesa-json-ir");
    EXPECT_EQ(j["format_version"], 1);
    ASSERT_TRUE(j["elements"].is_array());
    EXPECT_EQ(j["elements"].size(), 3u);
}

TEST(JsonExportTest, CommandFields) {
    auto j = documentToJson("ZELDA |SAY| \"Hello\"\n|WAIT|\n");

    const auto& say = j["elements"][0];
    EXPECT_EQ(say["type"], "command");
    EXPECT_EQ(say["name"], "SAY");
    EXPECT_EQ(say["prefix"], "ZELDA");
    EXPECT_EQ(say["suffix"], "\"Hello\"");
    EXPECT_EQ(say["line"], 1);

    const auto& wait = j["elements"][1];
    EXPECT_TRUE(wait["prefix"].is_null());
    EXPECT_TRUE(wait["suffix"].is_null());
    EXPECT_EQ(wait["line"], 2);
}

TEST(JsonExportTest, MarkerAndComment) {
    auto j = documentToJson("//hello\n%START%\n");

    EXPECT_EQ(j["elements"][0]["type"], "comment");
    EXPECT_EQ(j["elements"][0]["text"], "hello");
    EXPECT_EQ(j["elements"][1]["type"], "marker");
    EXPECT_EQ(j["elements"][1]["name"], "START");
}

TEST(JsonExportTest, NestedBlocks) {
    auto j = documentToJson(
        "|CHOICE| a\n"
        "    |SAY| in a\n"
        "        |SAY| deeper\n"
    );

    const auto& block = j["elements"][1];
    EXPECT_EQ(block["type"], "block");
    ASSERT_EQ(block["elements"].size(), 2u);
    EXPECT_EQ(block["elements"][0]["suffix"], "in a");
    EXPECT_EQ(block["elements"][1]["type"], "block");
    EXPECT_EQ(block["elements"][1]["elements"][0]["suffix"], "deeper");
}

TEST(JsonExportTest, EmptyDocument) {
    auto j = Daesa::JsonExport::toJson(Daesa::Document());
    EXPECT_TRUE(j["elements"].is_array());
    EXPECT_TRUE(j["elements"].empty());
}

TEST(JsonExportTest, JsonStringIsParseable) {
    Daesa::Parser parser;
    ASSERT_TRUE(parser.parseString("%START%\n|SAY| \"quotes\" and \\ backslash\n%END%\n"));
    std::string text = Daesa::JsonExport::toJsonString(parser.getDocument());

    auto j = json::parse(text);
    EXPECT_EQ(j["elements"][1]["suffix"], "\"quotes\" and \\ backslash");
}

// ============================================================
// State tree
// ============================================================

TEST(JsonExportTest, TreeNodesAndLinks) {
    auto j = treeToJson(
        "%START%\n"
        "A |SAY| \"hi\"\n"
        "|CHOICE| \"yes\"\n"
        "    B |SAY| \"ok\"\n"
        "|CHOICE| \"no\"\n"
        "    B |SAY| \"not ok\"\n"
        "%END%\n"
    );

    EXPECT_EQ(j["format"], "daesa-json-tree");
    EXPECT_EQ(j["first_node"], 0);
    ASSERT_EQ(j["nodes"].size(), 5u);

    const auto& yes = j["nodes"][1];
    EXPECT_EQ(yes["id"], 1);
    EXPECT_EQ(yes["command"]["name"], "CHOICE");
    EXPECT_TRUE(yes["parent"].is_null());
    ASSERT_EQ(yes["children"].size(), 1u);
    EXPECT_EQ(yes["children"][0], 2);
    EXPECT_EQ(yes["next"], 3);

    const auto& ok = j["nodes"][2];
    EXPECT_EQ(ok["parent"], 1);
    EXPECT_EQ(ok["next"], 3);

    EXPECT_TRUE(j["nodes"][4]["next"].is_null());
}

TEST(JsonExportTest, TreeMarkers) {
    auto j = treeToJson("%START%\n|SAY| a\n%MID%\n|SAY| b\n%END%\n");

    EXPECT_EQ(j["markers"]["START"], 0);
    EXPECT_EQ(j["markers"]["MID"], 1);
    EXPECT_TRUE(j["markers"]["END"].is_null());
}

TEST(JsonExportTest, TreeStringIsParseable) {
    auto stateTree = Daesa::TreeBuilder::build(DaesaTest::parseScript("%START%\n|SAY| a\n%END%\n"));
    auto j = json::parse(Daesa::JsonExport::treeToJsonString(stateTree, 4));
    EXPECT_EQ(j["nodes"].size(), 1u);
}
