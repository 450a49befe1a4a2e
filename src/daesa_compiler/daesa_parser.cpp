#include "daesa_parser.h"
#include "daesa_builder.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

namespace Daesa {

// --- 유틸리티 ---
void Parser::addError(int lineNum, const std::string& msg) {
    std::string formatted = filename_ + ":" + std::to_string(lineNum) + ": " + msg;
    errors_.push_back(formatted);
    if (error_.empty()) {
        error_ = formatted;
    }
}

static bool isBlank(const std::string& str) {
    return str.find_first_not_of(" \t\r") == std::string::npos;
}

// =================================================================
// 줄 단위 파서
// =================================================================
bool Parser::parseContent(const std::string& content, int lineNum, Element& out) {
    // 주석: "//" 뒤는 원문 그대로
    if (content.compare(0, 2, "//") == 0) {
        out = Element::FromComment(content.substr(2), lineNum);
        return true;
    }

    if (content[0] == '%') {
        return parseMarkerLine(content, lineNum, out);
    }

    if (content.find('|') != std::string::npos) {
        return parseCommandLine(content, lineNum, out);
    }

    addError(lineNum, "unrecognized line: " + content);
    return false;
}

bool Parser::parseMarkerLine(const std::string& content, int lineNum, Element& out) {
    if (content.size() < 2 || content.back() != '%') {
        addError(lineNum, "marker line must have the form %NAME%: " + content);
        return false;
    }

    std::string name = content.substr(1, content.size() - 2);
    if (!isValidMarkerName(name)) {
        addError(lineNum, "invalid marker name '" + name + "' (expected [A-Z-]+)");
        return false;
    }

    out = Element::FromMarker(name, lineNum);
    return true;
}

bool Parser::parseCommandLine(const std::string& content, int lineNum, Element& out) {
    if (std::count(content.begin(), content.end(), '|') != 2) {
        addError(lineNum, "command line must contain exactly two '|': " + content);
        return false;
    }

    size_t open = content.find('|');
    size_t close = content.find('|', open + 1);

    Command command;
    command.name = content.substr(open + 1, close - open - 1);
    if (!isValidCommandName(command.name)) {
        addError(lineNum, "invalid command name '" + command.name + "' (expected [A-Z-]+)");
        return false;
    }

    // PREFIX + 공백 1칸 + |NAME|
    if (open > 0) {
        if (content[open - 1] != ' ' || open < 2) {
            addError(lineNum, "prefix must be separated from '|" + command.name + "|' by a space");
            return false;
        }
        command.prefix = content.substr(0, open - 1);
        command.hasPrefix = true;
    }

    // |NAME| + 공백 1칸 + SUFFIX
    if (close + 1 < content.size()) {
        if (content[close + 1] != ' ') {
            addError(lineNum, "suffix must be separated from '|" + command.name + "|' by a space");
            return false;
        }
        command.suffix = content.substr(close + 2);
        command.hasSuffix = true;
    }

    out = Element::FromCommand(command, lineNum);
    return true;
}

// =================================================================
// 블록 구성
// =================================================================
size_t Parser::collectElements(std::vector<SourceLine>& lines, size_t index,
                               size_t level, std::vector<Element>& out) {
    while (index < lines.size() && lines[index].level >= level) {
        if (lines[index].level == level) {
            out.push_back(std::move(lines[index].element));
            ++index;
            continue;
        }

        // 한 단계 더 깊은 줄들 → Block
        int blockLine = lines[index].element.lineNum;
        std::vector<Element> nested;
        index = collectElements(lines, index, level + 1, nested);
        out.push_back(Element::FromBlock(std::move(nested), blockLine));
    }
    return index;
}

// =================================================================
// 메인 파서
// =================================================================
bool Parser::parse(const std::string& filepath) {
    std::ifstream ifs(filepath, std::ios::binary);
    if (!ifs.is_open()) {
        filename_ = filepath;
        document_ = Document();
        error_ = "Failed to open file: " + filepath;
        errors_.clear();
        errors_.push_back(error_);
        return false;
    }

    std::stringstream ss;
    ss << ifs.rdbuf();
    return parseString(ss.str(), filepath);
}

bool Parser::parseString(const std::string& source, const std::string& filename) {
    filename_ = filename;
    document_ = Document();
    error_.clear();
    errors_.clear();

    std::vector<SourceLine> lines;
    int prevLevel = -1;

    // 재구성용 원문 형식
    bool hasBom = false;
    bool lineEndingSeen = false;
    std::string lineEnding = "\n";
    bool finalNewline = true;

    size_t start = 0;
    int lineNum = 0;
    while (start <= source.size()) {
        size_t end = source.find('\n', start);
        bool terminated = end != std::string::npos;
        if (!terminated) end = source.size();
        std::string rawLine = source.substr(start, end - start);
        start = end + 1;
        lineNum++;

        // BOM 제거 (UTF-8 BOM)
        if (lineNum == 1 && rawLine.size() >= 3 &&
            rawLine[0] == '\xEF' && rawLine[1] == '\xBB' && rawLine[2] == '\xBF') {
            rawLine = rawLine.substr(3);
            hasBom = true;
        }

        // CR 제거. 첫 번째 줄바꿈의 형식을 문서 전체의 줄 끝으로 쓴다.
        bool crlf = !rawLine.empty() && rawLine.back() == '\r';
        if (crlf) {
            rawLine.pop_back();
        }
        if (terminated && !lineEndingSeen) {
            lineEnding = crlf ? "\r\n" : "\n";
            lineEndingSeen = true;
        }

        // 빈 줄 (공백만 있는 줄 포함)
        if (isBlank(rawLine)) continue;
        finalNewline = terminated;

        size_t indent = 0;
        while (indent < rawLine.size() && rawLine[indent] == ' ') indent++;

        if (rawLine[indent] == '\t') {
            addError(lineNum, "tab character in indentation (use 4 spaces per level)");
            continue; // 에러 복구
        }
        if (indent % INDENT_WIDTH != 0) {
            addError(lineNum, "indentation of " + std::to_string(indent) +
                     " spaces is not a multiple of " + std::to_string(INDENT_WIDTH));
            continue;
        }

        int level = static_cast<int>(indent / INDENT_WIDTH);
        if (level > prevLevel + 1) {
            if (prevLevel < 0) {
                addError(lineNum, "the first line must not be indented");
            } else {
                addError(lineNum, "unexpected indentation (more than one level deeper than the previous line)");
            }
            level = prevLevel + 1; // 이후 줄 검사를 위해 보정
        }
        prevLevel = level;

        SourceLine line;
        line.level = static_cast<size_t>(level);
        if (!parseContent(rawLine.substr(indent), lineNum, line.element)) continue;
        lines.push_back(std::move(line));
    }

    if (hasErrors()) {
        return false;
    }

    collectElements(lines, 0, 0, document_.elements);
    document_.hasBom = hasBom;
    document_.lineEnding = lineEnding;
    document_.finalNewline = finalNewline;
    return true;
}

// =================================================================
// 컴파일 (.dsb 출력)
// =================================================================
std::vector<uint8_t> Parser::compileToBuffer() {
    if (hasErrors()) return {};
    return TreeBuilder::serialize(TreeBuilder::build(document_));
}

bool Parser::compile(const std::string& outputPath, std::ostream& log) {
    if (hasErrors()) {
        if (error_.empty()) error_ = "Cannot compile: parse errors exist";
        return false;
    }

    StateTree stateTree = TreeBuilder::build(document_);
    std::vector<uint8_t> buffer = TreeBuilder::serialize(stateTree);

    std::ofstream ofs(outputPath, std::ios::binary);
    if (!ofs.is_open()) {
        error_ = "Failed to write: " + outputPath;
        errors_.push_back(error_);
        return false;
    }

    ofs.write(reinterpret_cast<const char*>(buffer.data()),
              static_cast<std::streamsize>(buffer.size()));
    ofs.close();

    log << "Compiled: " << outputPath
              << " (" << buffer.size() << " bytes, "
              << stateTree.tree.size() << " nodes, "
              << stateTree.markers.size() << " markers)" << std::endl;
    return true;
}

} // namespace Daesa
