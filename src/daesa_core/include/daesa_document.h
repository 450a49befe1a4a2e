#pragma once
#include <string>
#include <vector>

namespace Daesa {

// --- 내장 커맨드 / 마커 이름 ---
extern const char* const SAY_COMMAND;
extern const char* const CHOICE_COMMAND;
extern const char* const GOTO_COMMAND;
// 조건/변수용 예약 커맨드 (인식만 하고 해석하지 않음)
extern const char* const IF_COMMAND;
extern const char* const SET_COMMAND;
extern const char* const TRIGGER_COMMAND;

extern const char* const START_MARKER_NAME;
extern const char* const END_MARKER_NAME;

// 한 단계 들여쓰기 = 공백 4칸
constexpr size_t INDENT_WIDTH = 4;

// ALL-CAPS-KEBAB-CASE ([A-Z-]+)
bool isValidMarkerName(const std::string& name);
bool isValidCommandName(const std::string& name);

// --- Command: [PREFIX ]|NAME|[ SUFFIX] ---
struct Command {
    std::string name;
    std::string prefix;  // hasPrefix일 때만 의미 있음
    std::string suffix;  // hasSuffix일 때만 의미 있음
    bool hasPrefix = false;
    bool hasSuffix = false;

    static Command Make(const std::string& name);
    static Command Make(const std::string& name, const std::string& suffix);
    static Command Make(const std::string& name, const std::string& prefix, const std::string& suffix);

    bool isSpeech() const;
    bool isChoice() const;
    bool isJump() const;

    std::string toString() const;

    bool operator==(const Command& other) const;
    bool operator!=(const Command& other) const { return !(*this == other); }
};

// GOTO 접미사에서 마커 이름 추출 ("%NAME%" 또는 "NAME"). 형식이 틀리면 빈 문자열.
std::string jumpTarget(const Command& command);

// --- Marker: %NAME% ---
struct Marker {
    std::string name;

    std::string toString() const { return "%" + name + "%"; }
    bool operator==(const Marker& other) const { return name == other.name; }
    bool operator!=(const Marker& other) const { return name != other.name; }
};

// --- Comment: //text ---
struct Comment {
    std::string text; // "//" 뒤의 원문 그대로

    std::string toString() const { return "//" + text; }
};

// --- Line: Command 또는 Marker ---
struct Line {
    enum Type { COMMAND, MARKER };
    Type type = COMMAND;
    Command command;
    Marker marker;

    static Line FromCommand(const Command& c) { Line l; l.type = COMMAND; l.command = c; return l; }
    static Line FromMarker(const Marker& m) { Line l; l.type = MARKER; l.marker = m; return l; }

    bool isCommand() const { return type == COMMAND; }
    bool isMarker() const { return type == MARKER; }
    std::string toString() const;
};

struct Element;

// 한 단계 더 들여쓰여진 요소 묶음
struct Block {
    std::vector<Element> elements;
};

// --- Element: Line / Comment / Block ---
struct Element {
    enum Type { LINE, COMMENT, BLOCK };
    Type type = LINE;
    Line line;
    Comment comment;
    Block block;
    int lineNum = 0; // 원본 줄 번호 (비교/포맷에는 쓰지 않음)

    static Element FromLine(const Line& l, int lineNum = 0);
    static Element FromCommand(const Command& c, int lineNum = 0);
    static Element FromMarker(const std::string& name, int lineNum = 0);
    static Element FromComment(const std::string& text, int lineNum = 0);
    static Element FromBlock(std::vector<Element> elements, int lineNum = 0);

    bool isCommand() const { return type == LINE && line.isCommand(); }
    bool isMarker() const { return type == LINE && line.isMarker(); }

    // indent 단계만큼 들여써서 out에 덧붙인다. 줄마다 lineEnding으로 끝낸다.
    void format(std::string& out, size_t indent, const std::string& lineEnding = "\n") const;
};

// --- Document: 최상위 요소 시퀀스 ---
struct Document {
    std::vector<Element> elements;

    // 원문 형식 (toString 재구성용)
    bool hasBom = false;             // UTF-8 BOM으로 시작
    std::string lineEnding = "\n";   // "\n" 또는 "\r\n"
    bool finalNewline = true;        // 마지막 줄 뒤 줄바꿈 유무

    bool empty() const { return elements.empty(); }

    // 원문 재구성 (빈 줄 제외 바이트 단위 일치)
    std::string toString() const;
};

} // namespace Daesa
