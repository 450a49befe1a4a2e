#include "daesa_document.h"

namespace Daesa {

const char* const SAY_COMMAND = "SAY";
const char* const CHOICE_COMMAND = "CHOICE";
const char* const GOTO_COMMAND = "GOTO";
const char* const IF_COMMAND = "IF";
const char* const SET_COMMAND = "SET";
const char* const TRIGGER_COMMAND = "TRIGGER";

const char* const START_MARKER_NAME = "START";
const char* const END_MARKER_NAME = "END";

bool isValidMarkerName(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (!((c >= 'A' && c <= 'Z') || c == '-')) return false;
    }
    return true;
}

bool isValidCommandName(const std::string& name) {
    return isValidMarkerName(name);
}

// --- Command ---
Command Command::Make(const std::string& name) {
    Command c;
    c.name = name;
    return c;
}

Command Command::Make(const std::string& name, const std::string& suffix) {
    Command c;
    c.name = name;
    c.suffix = suffix;
    c.hasSuffix = true;
    return c;
}

Command Command::Make(const std::string& name, const std::string& prefix, const std::string& suffix) {
    Command c = Make(name, suffix);
    c.prefix = prefix;
    c.hasPrefix = true;
    return c;
}

bool Command::isSpeech() const { return name == SAY_COMMAND; }
bool Command::isChoice() const { return name == CHOICE_COMMAND; }
bool Command::isJump() const { return name == GOTO_COMMAND; }

std::string Command::toString() const {
    std::string out;
    if (hasPrefix) {
        out += prefix;
        out += ' ';
    }
    out += '|';
    out += name;
    out += '|';
    if (hasSuffix) {
        out += ' ';
        out += suffix;
    }
    return out;
}

bool Command::operator==(const Command& other) const {
    if (name != other.name) return false;
    if (hasPrefix != other.hasPrefix || hasSuffix != other.hasSuffix) return false;
    if (hasPrefix && prefix != other.prefix) return false;
    if (hasSuffix && suffix != other.suffix) return false;
    return true;
}

std::string jumpTarget(const Command& command) {
    if (!command.hasSuffix) return "";
    std::string target = command.suffix;
    if (target.size() >= 2 && target.front() == '%' && target.back() == '%') {
        target = target.substr(1, target.size() - 2);
    }
    return isValidMarkerName(target) ? target : "";
}

// --- Line ---
std::string Line::toString() const {
    switch (type) {
        case COMMAND: return command.toString();
        case MARKER:  return marker.toString();
    }
    return "";
}

// --- Element ---
Element Element::FromLine(const Line& l, int lineNum) {
    Element e;
    e.type = LINE;
    e.line = l;
    e.lineNum = lineNum;
    return e;
}

Element Element::FromCommand(const Command& c, int lineNum) {
    return FromLine(Line::FromCommand(c), lineNum);
}

Element Element::FromMarker(const std::string& name, int lineNum) {
    Marker m;
    m.name = name;
    return FromLine(Line::FromMarker(m), lineNum);
}

Element Element::FromComment(const std::string& text, int lineNum) {
    Element e;
    e.type = COMMENT;
    e.comment.text = text;
    e.lineNum = lineNum;
    return e;
}

Element Element::FromBlock(std::vector<Element> elements, int lineNum) {
    Element e;
    e.type = BLOCK;
    e.block.elements = std::move(elements);
    e.lineNum = lineNum;
    return e;
}

void Element::format(std::string& out, size_t indent, const std::string& lineEnding) const {
    switch (type) {
        case LINE:
            out.append(indent * INDENT_WIDTH, ' ');
            out += line.toString();
            out += lineEnding;
            break;
        case COMMENT:
            out.append(indent * INDENT_WIDTH, ' ');
            out += comment.toString();
            out += lineEnding;
            break;
        case BLOCK:
            for (const auto& child : block.elements) {
                child.format(out, indent + 1, lineEnding);
            }
            break;
    }
}

// --- Document ---
std::string Document::toString() const {
    std::string out;
    if (hasBom) out += "\xEF\xBB\xBF";
    for (const auto& el : elements) {
        el.format(out, 0, lineEnding);
    }

    // 원문이 줄바꿈 없이 끝났으면 마지막 줄바꿈을 떼어낸다
    if (!finalNewline && !elements.empty() && out.size() >= lineEnding.size() &&
        out.compare(out.size() - lineEnding.size(), lineEnding.size(), lineEnding) == 0) {
        out.erase(out.size() - lineEnding.size());
    }
    return out;
}

} // namespace Daesa
