#pragma once
#include "daesa_document.h"
#include "daesa_error.h"
#include <ostream>
#include <string>
#include <unordered_set>
#include <vector>

namespace Daesa {

enum class RuleSeverity { ALLOW, WARN, DENY };

const char* ruleSeverityName(RuleSeverity severity);
// "allow" / "warn" / "deny" (대소문자 무시)
bool parseRuleSeverity(const std::string& text, RuleSeverity& out);

struct ValidatorOptions {
    // 내장/예약되지 않은 커맨드 이름
    RuleSeverity unknownCommands = RuleSeverity::DENY;
    // %START% 바로 뒤의 블록 (부모 커맨드 없이 평탄화됨)
    RuleSeverity topLevelBlock = RuleSeverity::ALLOW;

    // {"unknown_commands": "warn", "top_level_block": "deny"}
    bool loadFromJson(const std::string& text, std::string& error);
    bool loadFromFile(const std::string& filepath, std::string& error);
};

struct ValidationIssue {
    enum Level { ERROR, WARNING };
    enum Kind {
        EMPTY_SCRIPT,
        MISSING_START,
        MARKER_BEFORE_START,
        EMPTY_START,
        TOP_LEVEL_BLOCK,
        MISSING_END,
        END_NOT_LAST,
        DUPLICATE_MARKER,
        CONSECUTIVE_MARKERS,
        INVALID_COMMAND,
        LEAF_CHOICE,
        UNDEFINED_MARKER,
        UNREACHABLE_CODE,
        UNKNOWN_COMMAND,
        ORPHAN_BLOCK
    };
    Level level;
    Kind kind;
    int line;
    std::string detail;
};

struct ValidationReport {
    // 메트릭
    int commandCount = 0;
    int markerCount = 0;
    int commentCount = 0;
    int maxDepth = 0;
    // 이슈
    std::vector<ValidationIssue> issues;

    bool hasErrors() const;
    int errorCount() const;
    int warningCount() const;

    // 첫 번째 ERROR → VALIDATION_FAILURE (없으면 NONE)
    Error firstError() const;
};

// 파싱된 Document의 의미 규칙 검사 (파싱 후, 빌드 전)
class Validator {
public:
    ValidationReport validate(const Document& document,
                              const ValidatorOptions& options = ValidatorOptions());

    // 리포트 출력
    static void printReport(const ValidationReport& report, std::ostream& out);

    static const char* kindName(ValidationIssue::Kind kind);

private:
    ValidationReport* report_ = nullptr;
    ValidatorOptions options_;
    std::unordered_set<std::string> definedMarkers_;
    std::unordered_set<std::string> seenMarkers_;
    // 아직 커맨드에 묶이지 않은 마지막 마커 (블록 경계를 넘어 유지)
    const Element* pendingMarker_ = nullptr;

    void addIssue(ValidationIssue::Level level, ValidationIssue::Kind kind,
                  int line, const std::string& detail);
    void addSeverityIssue(RuleSeverity severity, ValidationIssue::Kind kind,
                          int line, const std::string& detail);

    // 검사 패스
    void collectMarkers(const std::vector<Element>& elements);
    void checkStartAndEnd(const std::vector<Element>& elements);
    void checkElements(const std::vector<Element>& elements, int depth);
    void checkCommand(const Command& command, int line, bool hasBlock);
};

} // namespace Daesa
