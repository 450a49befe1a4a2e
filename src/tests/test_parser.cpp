#include <gtest/gtest.h>
#include "test_helpers.h"
#include "daesa_parser.h"
#include <fstream>
#include <sstream>
#include <string>

using namespace Daesa;

// --- 줄 형식 ---

TEST(ParserTest, CommandWithPrefixAndSuffix) {
    Parser parser;
    ASSERT_TRUE(parser.parseString("ZELDA |SAY| \"Hello, world!\"\n"));

    const auto& doc = parser.getDocument();
    ASSERT_EQ(doc.elements.size(), 1u);
    ASSERT_TRUE(doc.elements[0].isCommand());

    const Command& c = doc.elements[0].line.command;
    EXPECT_EQ(c.name, "SAY");
    EXPECT_TRUE(c.hasPrefix);
    EXPECT_EQ(c.prefix, "ZELDA");
    EXPECT_TRUE(c.hasSuffix);
    EXPECT_EQ(c.suffix, "\"Hello, world!\"");
}

TEST(ParserTest, CommandWithSuffixOnly) {
    Parser parser;
    ASSERT_TRUE(parser.parseString("|CHOICE| Do the thing\n"));

    const Command& c = parser.getDocument().elements[0].line.command;
    EXPECT_EQ(c.name, "CHOICE");
    EXPECT_FALSE(c.hasPrefix);
    EXPECT_EQ(c.suffix, "Do the thing");
}

TEST(ParserTest, BareCommand) {
    Parser parser;
    ASSERT_TRUE(parser.parseString("|FADE-OUT|\n"));

    const Command& c = parser.getDocument().elements[0].line.command;
    EXPECT_EQ(c.name, "FADE-OUT");
    EXPECT_FALSE(c.hasPrefix);
    EXPECT_FALSE(c.hasSuffix);
}

TEST(ParserTest, SuffixKeptVerbatim) {
    Parser parser;
    ASSERT_TRUE(parser.parseString("|SAY|   three spaces,  inner  gaps \n"));

    const Command& c = parser.getDocument().elements[0].line.command;
    EXPECT_EQ(c.suffix, "  three spaces,  inner  gaps ");
}

TEST(ParserTest, MultiWordPrefix) {
    Parser parser;
    ASSERT_TRUE(parser.parseString("Old Man |SAY| It's dangerous to go alone\n"));

    const Command& c = parser.getDocument().elements[0].line.command;
    EXPECT_EQ(c.prefix, "Old Man");
}

TEST(ParserTest, Marker) {
    Parser parser;
    ASSERT_TRUE(parser.parseString("%START%\n%PART-TWO%\n"));

    const auto& doc = parser.getDocument();
    ASSERT_EQ(doc.elements.size(), 2u);
    ASSERT_TRUE(doc.elements[0].isMarker());
    EXPECT_EQ(doc.elements[0].line.marker.name, "START");
    EXPECT_EQ(doc.elements[1].line.marker.name, "PART-TWO");
}

TEST(ParserTest, CommentKeepsText) {
    Parser parser;
    ASSERT_TRUE(parser.parseString("//  spaced | not a command\n"));

    const auto& doc = parser.getDocument();
    ASSERT_EQ(doc.elements.size(), 1u);
    EXPECT_EQ(doc.elements[0].type, Element::COMMENT);
    EXPECT_EQ(doc.elements[0].comment.text, "  spaced | not a command");
}

// --- 블록 ---

TEST(ParserTest, IndentedLinesFormBlock) {
    Parser parser;
    ASSERT_TRUE(parser.parseString(
        "|SAY| First level\n"
        "    |SAY| Second level\n"
        "        |SAY| Third level\n"
        "|SAY| Back at the top\n"
    ));

    const auto& doc = parser.getDocument();
    ASSERT_EQ(doc.elements.size(), 3u);
    EXPECT_TRUE(doc.elements[0].isCommand());
    ASSERT_EQ(doc.elements[1].type, Element::BLOCK);
    EXPECT_TRUE(doc.elements[2].isCommand());

    const auto& inner = doc.elements[1].block.elements;
    ASSERT_EQ(inner.size(), 2u);
    EXPECT_EQ(inner[0].line.command.suffix, "Second level");
    ASSERT_EQ(inner[1].type, Element::BLOCK);
    EXPECT_EQ(inner[1].block.elements[0].line.command.suffix, "Third level");
}

TEST(ParserTest, DedentByMoreThanOneLevel) {
    Parser parser;
    ASSERT_TRUE(parser.parseString(
        "|CHOICE| do the thing\n"
        "    |CHOICE| do the other thing\n"
        "        |CHOICE| do the third thing\n"
        "|SAY| We're back at the top level now\n"
    ));

    const auto& doc = parser.getDocument();
    ASSERT_EQ(doc.elements.size(), 3u);
    EXPECT_EQ(doc.elements[2].line.command.suffix, "We're back at the top level now");
}

TEST(ParserTest, LineNumbersRecorded) {
    Parser parser;
    ASSERT_TRUE(parser.parseString(
        "%START%\n"
        "\n"
        "|SAY| hi\n"
        "    |SAY| nested\n"
    ));

    const auto& doc = parser.getDocument();
    EXPECT_EQ(doc.elements[0].lineNum, 1);
    EXPECT_EQ(doc.elements[1].lineNum, 3);
    EXPECT_EQ(doc.elements[2].lineNum, 4);
    EXPECT_EQ(doc.elements[2].block.elements[0].lineNum, 4);
}

// --- 원문 재구성 ---

TEST(ParserTest, FormatRoundTrip) {
    std::string source =
        "// intro\n"
        "%START%\n"
        "A |SAY| \"hi\"\n"
        "|CHOICE| \"yes\"\n"
        "    B |SAY| \"ok\"\n"
        "    //    odd comment\n"
        "|CHOICE| \"no\"\n"
        "    B |SAY| \"not ok\"\n"
        "        |TRIGGER| sulk\n"
        "|WAIT|\n"
        "%END%\n";

    Parser parser;
    ASSERT_TRUE(parser.parseString(source));
    EXPECT_EQ(parser.getDocument().toString(), source);
}

TEST(ParserTest, BlankLinesAreDropped) {
    Parser parser;
    ASSERT_TRUE(parser.parseString("%START%\n\n   \n|SAY| hi\n\n%END%"));
    EXPECT_EQ(parser.getDocument().toString(), "%START%\n|SAY| hi\n%END%");

    ASSERT_TRUE(parser.parseString("%START%\n|SAY| hi\n%END%\n\n   \n"));
    EXPECT_EQ(parser.getDocument().toString(), "%START%\n|SAY| hi\n%END%\n");
}

TEST(ParserTest, NoFinalNewlineRoundTrip) {
    std::string source =
        "%START%\n"
        "A |SAY| \"hi\"\n"
        "|CHOICE| \"yes\"\n"
        "    B |SAY| \"ok\"\n"
        "|CHOICE| \"no\"\n"
        "    B |SAY| \"not ok\"\n"
        "%END%";

    Parser parser;
    ASSERT_TRUE(parser.parseString(source));
    EXPECT_FALSE(parser.getDocument().finalNewline);
    EXPECT_EQ(parser.getDocument().toString(), source);
}

TEST(ParserTest, NoFinalNewlineInsideBlock) {
    std::string source = "|CHOICE| a\n    |SAY| last";
    Parser parser;
    ASSERT_TRUE(parser.parseString(source));
    EXPECT_EQ(parser.getDocument().toString(), source);
}

TEST(ParserTest, CrLfAndBom) {
    std::string source = "\xEF\xBB\xBF%START%\r\n|SAY| hi\r\n%END%\r\n";
    Parser parser;
    ASSERT_TRUE(parser.parseString(source));

    const auto& doc = parser.getDocument();
    ASSERT_EQ(doc.elements.size(), 3u);
    EXPECT_EQ(doc.elements[0].line.marker.name, "START");
    EXPECT_EQ(doc.elements[1].line.command.suffix, "hi");
    EXPECT_TRUE(doc.hasBom);
    EXPECT_EQ(doc.lineEnding, "\r\n");
    EXPECT_EQ(doc.toString(), source);
}

TEST(ParserTest, CrLfRoundTrip) {
    std::string source = "%START%\r\n|SAY| hi\r\n    |SAY| nested\r\n%END%\r\n";
    Parser parser;
    ASSERT_TRUE(parser.parseString(source));
    EXPECT_FALSE(parser.getDocument().hasBom);
    EXPECT_EQ(parser.getDocument().toString(), source);

    ASSERT_TRUE(parser.parseString("%START%\r\n|SAY| hi\r\n%END%"));
    EXPECT_EQ(parser.getDocument().toString(), "%START%\r\n|SAY| hi\r\n%END%");
}

TEST(ParserTest, EmptySourceIsEmptyDocument) {
    Parser parser;
    EXPECT_TRUE(parser.parseString(""));
    EXPECT_TRUE(parser.getDocument().empty());
}

// --- 에러 ---

TEST(ParserTest, TabIndentationIsError) {
    Parser parser;
    EXPECT_FALSE(parser.parseString("|SAY| hi\n\t|SAY| nested\n", "tabs.script"));
    ASSERT_EQ(parser.getErrors().size(), 1u);
    EXPECT_EQ(parser.getError().rfind("tabs.script:2: ", 0), 0u);
}

TEST(ParserTest, IndentNotMultipleOfFour) {
    Parser parser;
    EXPECT_FALSE(parser.parseString("|SAY| hi\n  |SAY| nested\n"));
    EXPECT_TRUE(parser.hasErrors());
}

TEST(ParserTest, OverIndentationIsError) {
    Parser parser;
    EXPECT_FALSE(parser.parseString("|SAY| hi\n        |SAY| too deep\n"));
    EXPECT_NE(parser.getError().find("<string>:2:"), std::string::npos);
}

TEST(ParserTest, IndentedFirstLineIsError) {
    Parser parser;
    EXPECT_FALSE(parser.parseString("    |SAY| hi\n"));
    EXPECT_TRUE(parser.hasErrors());
}

TEST(ParserTest, ThreePipesIsError) {
    Parser parser;
    EXPECT_FALSE(parser.parseString("|SAY| a | b\n"));
    EXPECT_NE(parser.getError().find("exactly two"), std::string::npos);
}

TEST(ParserTest, LowercaseCommandNameIsError) {
    Parser parser;
    EXPECT_FALSE(parser.parseString("|say| hi\n"));
    EXPECT_TRUE(parser.hasErrors());
}

TEST(ParserTest, PrefixWithoutSpaceIsError) {
    Parser parser;
    EXPECT_FALSE(parser.parseString("A|SAY| hi\n"));
    EXPECT_TRUE(parser.hasErrors());
}

TEST(ParserTest, SuffixWithoutSpaceIsError) {
    Parser parser;
    EXPECT_FALSE(parser.parseString("|SAY|hi\n"));
    EXPECT_TRUE(parser.hasErrors());
}

TEST(ParserTest, InvalidMarkerName) {
    Parser parser;
    EXPECT_FALSE(parser.parseString("%start%\n"));
    EXPECT_FALSE(parser.parseString("%START% trailing\n"));
    EXPECT_FALSE(parser.parseString("%%\n"));
}

TEST(ParserTest, UnrecognizedLine) {
    Parser parser;
    EXPECT_FALSE(parser.parseString("just some words\n"));
    EXPECT_NE(parser.getError().find("just some words"), std::string::npos);
}

TEST(ParserTest, CollectsAllErrorsAndLeavesEmptyDocument) {
    Parser parser;
    EXPECT_FALSE(parser.parseString(
        "%START%\n"
        "|say| one\n"
        "|SAY| fine\n"
        "what\n"
        "%END\n"
    ));
    ASSERT_EQ(parser.getErrors().size(), 3u);
    EXPECT_EQ(parser.getErrors()[0].rfind("<string>:2: ", 0), 0u);
    EXPECT_EQ(parser.getErrors()[1].rfind("<string>:4: ", 0), 0u);
    EXPECT_EQ(parser.getErrors()[2].rfind("<string>:5: ", 0), 0u);
    EXPECT_TRUE(parser.getDocument().empty());
}

TEST(ParserTest, ReparseClearsPreviousErrors) {
    Parser parser;
    EXPECT_FALSE(parser.parseString("oops\n"));
    EXPECT_TRUE(parser.parseString("|SAY| ok\n"));
    EXPECT_FALSE(parser.hasErrors());
    EXPECT_TRUE(parser.getError().empty());
}

TEST(ParserTest, MissingFile) {
    Parser parser;
    EXPECT_FALSE(parser.parse("definitely_missing_file.script"));
    EXPECT_NE(parser.getError().find("Failed to open file"), std::string::npos);
}

TEST(ParserTest, ExampleScriptsParse) {
    for (const char* name : {"yes-or-no.script", "capital-of-spain.script",
                             "daisy-and-luigi.script", "two-line.script"}) {
        Parser parser;
        std::string path = std::string(DAESA_EXAMPLE_SCRIPTS_DIR) + "/" + name;
        EXPECT_TRUE(parser.parse(path)) << path << ": " << parser.getError();
    }
}

TEST(ParserTest, ExampleScriptsRoundTrip) {
    for (const char* name : {"yes-or-no.script", "capital-of-spain.script",
                             "daisy-and-luigi.script", "two-line.script"}) {
        std::string path = std::string(DAESA_EXAMPLE_SCRIPTS_DIR) + "/" + name;
        std::ifstream ifs(path, std::ios::binary);
        ASSERT_TRUE(ifs.is_open()) << path;
        std::stringstream ss;
        ss << ifs.rdbuf();
        std::string source = ss.str();

        // 빈 줄은 재구성되지 않으므로 빈 줄 없는 파일만 바이트 단위로 비교
        bool hasBlankLine = source.find("\n\n") != std::string::npos ||
                            source.find("\n\r\n") != std::string::npos;

        Parser parser;
        ASSERT_TRUE(parser.parseString(source, path)) << parser.getError();
        std::string formatted = parser.getDocument().toString();
        if (!hasBlankLine) {
            EXPECT_EQ(formatted, source) << path;
        }

        // 재구성 결과는 다시 파싱해도 그대로
        Parser reparsed;
        ASSERT_TRUE(reparsed.parseString(formatted, path));
        EXPECT_EQ(reparsed.getDocument().toString(), formatted) << path;
    }
}

// --- 문서 모델 ---

TEST(DocumentTest, CommandEqualityIgnoresUnsetFields) {
    Command a = Command::Make("SAY", "hi");
    Command b = Command::Make("SAY", "hi");
    b.prefix = "ignored while hasPrefix is false";
    EXPECT_EQ(a, b);
    EXPECT_NE(a, Command::Make("SAY", "A", "hi"));
    EXPECT_NE(Command::Make("SAY"), Command::Make("SAY", ""));
}

TEST(DocumentTest, CommandToString) {
    EXPECT_EQ(Command::Make("WAIT").toString(), "|WAIT|");
    EXPECT_EQ(Command::Make("SAY", "hi").toString(), "|SAY| hi");
    EXPECT_EQ(Command::Make("SAY", "A", "hi").toString(), "A |SAY| hi");
}

TEST(DocumentTest, JumpTarget) {
    EXPECT_EQ(jumpTarget(Command::Make("GOTO", "%LOOP%")), "LOOP");
    EXPECT_EQ(jumpTarget(Command::Make("GOTO", "LOOP")), "LOOP");
    EXPECT_EQ(jumpTarget(Command::Make("GOTO", "%loop%")), "");
    EXPECT_EQ(jumpTarget(Command::Make("GOTO")), "");
}

TEST(DocumentTest, MarkerNames) {
    EXPECT_TRUE(isValidMarkerName("START"));
    EXPECT_TRUE(isValidMarkerName("PART-TWO"));
    EXPECT_FALSE(isValidMarkerName(""));
    EXPECT_FALSE(isValidMarkerName("Start"));
    EXPECT_FALSE(isValidMarkerName("PART_TWO"));
}

TEST(DocumentTest, FormatIndentsBlocks) {
    Document doc;
    doc.elements.push_back(Element::FromMarker("START"));
    doc.elements.push_back(Element::FromCommand(Command::Make("SAY", "parent")));
    doc.elements.push_back(Element::FromBlock({
        Element::FromCommand(Command::Make("SAY", "child")),
        Element::FromComment(" note"),
    }));
    EXPECT_EQ(doc.toString(), "%START%\n|SAY| parent\n    |SAY| child\n    // note\n");
}
