#include "daesa_validator.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace Daesa {

// =================================================================
// RuleSeverity / ValidatorOptions
// =================================================================
const char* ruleSeverityName(RuleSeverity severity) {
    switch (severity) {
        case RuleSeverity::ALLOW: return "allow";
        case RuleSeverity::WARN:  return "warn";
        case RuleSeverity::DENY:  return "deny";
    }
    return "?";
}

bool parseRuleSeverity(const std::string& text, RuleSeverity& out) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "allow") { out = RuleSeverity::ALLOW; return true; }
    if (lower == "warn")  { out = RuleSeverity::WARN;  return true; }
    if (lower == "deny")  { out = RuleSeverity::DENY;  return true; }
    return false;
}

bool ValidatorOptions::loadFromJson(const std::string& text, std::string& error) {
    json config = json::parse(text, nullptr, false);
    if (config.is_discarded()) {
        error = "configuration is not valid JSON";
        return false;
    }
    if (!config.is_object()) {
        error = "configuration must be a JSON object";
        return false;
    }

    // 알 수 없는 키는 무시
    auto readSeverity = [&](const char* key, RuleSeverity& target) {
        auto it = config.find(key);
        if (it == config.end()) return true;
        if (!it->is_string() || !parseRuleSeverity(it->get<std::string>(), target)) {
            error = std::string("invalid severity for '") + key + "' (expected allow, warn or deny)";
            return false;
        }
        return true;
    };

    RuleSeverity unknown = unknownCommands;
    RuleSeverity topLevel = topLevelBlock;
    if (!readSeverity("unknown_commands", unknown)) return false;
    if (!readSeverity("top_level_block", topLevel)) return false;

    unknownCommands = unknown;
    topLevelBlock = topLevel;
    return true;
}

bool ValidatorOptions::loadFromFile(const std::string& filepath, std::string& error) {
    std::ifstream ifs(filepath);
    if (!ifs.is_open()) {
        error = "Failed to open file: " + filepath;
        return false;
    }
    std::stringstream ss;
    ss << ifs.rdbuf();

    if (!loadFromJson(ss.str(), error)) {
        error = filepath + ": " + error;
        return false;
    }
    return true;
}

// =================================================================
// ValidationReport
// =================================================================
bool ValidationReport::hasErrors() const {
    return errorCount() > 0;
}

int ValidationReport::errorCount() const {
    return static_cast<int>(std::count_if(issues.begin(), issues.end(),
        [](const ValidationIssue& i) { return i.level == ValidationIssue::ERROR; }));
}

int ValidationReport::warningCount() const {
    return static_cast<int>(std::count_if(issues.begin(), issues.end(),
        [](const ValidationIssue& i) { return i.level == ValidationIssue::WARNING; }));
}

Error ValidationReport::firstError() const {
    Error error;
    for (const auto& issue : issues) {
        if (issue.level == ValidationIssue::ERROR) {
            error.kind = ErrorKind::VALIDATION_FAILURE;
            error.message = "line " + std::to_string(issue.line) + ": " + issue.detail;
            break;
        }
    }
    return error;
}

// =================================================================
// Validator
// =================================================================
static const size_t NO_ELEMENT = static_cast<size_t>(-1);

// index 다음의 첫 비주석 요소
static size_t nextNonComment(const std::vector<Element>& elements, size_t index) {
    for (size_t i = index + 1; i < elements.size(); ++i) {
        if (elements[i].type != Element::COMMENT) return i;
    }
    return NO_ELEMENT;
}

static bool isMarkerNamed(const Element& el, const char* name) {
    return el.isMarker() && el.line.marker.name == name;
}

void Validator::addIssue(ValidationIssue::Level level, ValidationIssue::Kind kind,
                         int line, const std::string& detail) {
    report_->issues.push_back({level, kind, line, detail});
}

void Validator::addSeverityIssue(RuleSeverity severity, ValidationIssue::Kind kind,
                                 int line, const std::string& detail) {
    switch (severity) {
        case RuleSeverity::ALLOW:
            break;
        case RuleSeverity::WARN:
            addIssue(ValidationIssue::WARNING, kind, line, detail);
            break;
        case RuleSeverity::DENY:
            addIssue(ValidationIssue::ERROR, kind, line, detail);
            break;
    }
}

ValidationReport Validator::validate(const Document& document, const ValidatorOptions& options) {
    ValidationReport report;
    report_ = &report;
    options_ = options;
    definedMarkers_.clear();
    seenMarkers_.clear();
    pendingMarker_ = nullptr;

    collectMarkers(document.elements);
    checkStartAndEnd(document.elements);
    checkElements(document.elements, 0);

    report_ = nullptr;
    return report;
}

void Validator::collectMarkers(const std::vector<Element>& elements) {
    for (const auto& el : elements) {
        if (el.isMarker()) {
            definedMarkers_.insert(el.line.marker.name);
        } else if (el.type == Element::BLOCK) {
            collectMarkers(el.block.elements);
        }
    }
}

// --- %START% / %END% 배치 ---
void Validator::checkStartAndEnd(const std::vector<Element>& elements) {
    // 앞쪽 주석은 허용
    size_t first = (!elements.empty() && elements[0].type != Element::COMMENT)
        ? 0 : nextNonComment(elements, 0);
    if (first == NO_ELEMENT) {
        addIssue(ValidationIssue::ERROR, ValidationIssue::EMPTY_SCRIPT, 0,
                 "script is empty; valid scripts must have %START% and %END% markers and at least one command");
        return;
    }

    const Element& head = elements[first];
    if (isMarkerNamed(head, START_MARKER_NAME)) {
        size_t after = nextNonComment(elements, first);
        if (after == NO_ELEMENT) {
            addIssue(ValidationIssue::ERROR, ValidationIssue::EMPTY_START, head.lineNum,
                     "the %START% marker should be followed by at least one command");
        } else if (isMarkerNamed(elements[after], END_MARKER_NAME)) {
            addIssue(ValidationIssue::ERROR, ValidationIssue::EMPTY_START, elements[after].lineNum,
                     "scripts must contain at least one command between the %START% and %END% markers");
        } else if (elements[after].type == Element::BLOCK) {
            addSeverityIssue(options_.topLevelBlock, ValidationIssue::TOP_LEVEL_BLOCK,
                             elements[after].lineNum,
                             "block directly after %START% has no parent command and runs at the top level");
        }
    } else if (head.isMarker()) {
        addIssue(ValidationIssue::ERROR, ValidationIssue::MARKER_BEFORE_START, head.lineNum,
                 "marker " + head.line.marker.toString() + " shouldn't be declared before the %START% marker");
    } else {
        addIssue(ValidationIssue::ERROR, ValidationIssue::MISSING_START, head.lineNum,
                 "script must start with a %START% marker");
    }

    size_t end = NO_ELEMENT;
    for (size_t i = 0; i < elements.size(); ++i) {
        if (isMarkerNamed(elements[i], END_MARKER_NAME)) {
            end = i;
            break;
        }
    }

    if (end == NO_ELEMENT) {
        addIssue(ValidationIssue::ERROR, ValidationIssue::MISSING_END, elements.back().lineNum,
                 "script must end with an %END% marker at the top level");
        return;
    }

    // 뒤에는 주석만 허용
    size_t trailing = nextNonComment(elements, end);
    if (trailing != NO_ELEMENT) {
        addIssue(ValidationIssue::ERROR, ValidationIssue::END_NOT_LAST, elements[trailing].lineNum,
                 "only comments may follow the %END% marker");
    }
}

// --- 요소별 규칙 (재귀) ---
void Validator::checkElements(const std::vector<Element>& elements, int depth) {
    report_->maxDepth = std::max(report_->maxDepth, depth);

    // 직전 비주석 요소
    const Element* prev = nullptr;

    for (size_t i = 0; i < elements.size(); ++i) {
        const Element& el = elements[i];

        switch (el.type) {
            case Element::COMMENT:
                report_->commentCount++;
                continue;

            case Element::LINE: {
                if (el.line.isMarker()) {
                    const std::string& name = el.line.marker.name;
                    report_->markerCount++;

                    if (!seenMarkers_.insert(name).second) {
                        addIssue(ValidationIssue::ERROR, ValidationIssue::DUPLICATE_MARKER, el.lineNum,
                                 "marker %" + name + "% shouldn't be declared more than once");
                    }

                    if (pendingMarker_) {
                        // %START% 바로 뒤 %END%는 EMPTY_START로 이미 보고됨
                        bool emptyStart = pendingMarker_->line.marker.name == START_MARKER_NAME &&
                                          name == END_MARKER_NAME;
                        if (!emptyStart) {
                            addIssue(ValidationIssue::ERROR, ValidationIssue::CONSECUTIVE_MARKERS, el.lineNum,
                                     "marker %" + name + "% follows " + pendingMarker_->line.marker.toString() +
                                     " without a command in between");
                        }
                    }
                    pendingMarker_ = &el;
                    break;
                }

                const Command& command = el.line.command;
                report_->commandCount++;
                pendingMarker_ = nullptr;

                size_t next = nextNonComment(elements, i);
                bool hasBlock = next != NO_ELEMENT && elements[next].type == Element::BLOCK;
                checkCommand(command, el.lineNum, hasBlock);

                if (command.isJump()) {
                    size_t after = hasBlock ? nextNonComment(elements, next) : next;
                    if (after != NO_ELEMENT && elements[after].isCommand()) {
                        addIssue(ValidationIssue::ERROR, ValidationIssue::UNREACHABLE_CODE,
                                 elements[after].lineNum,
                                 "lines after a GOTO command within the same block are unreachable");
                    }
                }
                break;
            }

            case Element::BLOCK: {
                bool afterCommand = prev && prev->isCommand();
                bool afterStart = depth == 0 && prev && isMarkerNamed(*prev, START_MARKER_NAME);
                if (!afterCommand && !afterStart) {
                    addIssue(ValidationIssue::ERROR, ValidationIssue::ORPHAN_BLOCK, el.lineNum,
                             "an indented block must follow a command line");
                }
                checkElements(el.block.elements, depth + 1);
                break;
            }
        }

        prev = &el;
    }
}

// --- 커맨드별 규칙 ---
void Validator::checkCommand(const Command& command, int line, bool hasBlock) {
    auto invalid = [&](const std::string& detail) {
        addIssue(ValidationIssue::ERROR, ValidationIssue::INVALID_COMMAND, line, detail);
    };
    auto rejectPrefix = [&]() {
        if (command.hasPrefix) {
            invalid("the " + command.name + " command doesn't allow a prefix, but one was found: " +
                    command.prefix);
        }
    };
    auto requireSuffix = [&]() {
        if (!command.hasSuffix) {
            invalid("the " + command.name + " command requires a suffix, but none was found");
        }
    };

    if (command.name == SAY_COMMAND) {
        requireSuffix();
    } else if (command.name == CHOICE_COMMAND) {
        requireSuffix();
        rejectPrefix();
        if (!hasBlock) {
            addIssue(ValidationIssue::ERROR, ValidationIssue::LEAF_CHOICE, line,
                     "a CHOICE command must be followed by an indented block");
        }
    } else if (command.name == GOTO_COMMAND) {
        rejectPrefix();
        if (!command.hasSuffix) {
            invalid("the GOTO command requires a suffix, but none was found");
        } else {
            std::string target = jumpTarget(command);
            if (target.empty()) {
                invalid("the GOTO command requires a valid marker name, but '" +
                        command.suffix + "' was found");
            } else if (definedMarkers_.find(target) == definedMarkers_.end()) {
                addIssue(ValidationIssue::ERROR, ValidationIssue::UNDEFINED_MARKER, line,
                         "GOTO target %" + target + "% does not exist");
            }
        }
        if (hasBlock) {
            invalid("the GOTO command can't be followed by an indented block");
        }
    } else if (command.name == TRIGGER_COMMAND || command.name == SET_COMMAND) {
        rejectPrefix();
        requireSuffix();
    } else if (command.name == IF_COMMAND) {
        requireSuffix();
        if (!hasBlock) {
            invalid("the IF command must be followed by an indented block");
        }
    } else {
        addSeverityIssue(options_.unknownCommands, ValidationIssue::UNKNOWN_COMMAND, line,
                         "unknown command: " + command.name);
    }
}

// =================================================================
// 리포트
// =================================================================
const char* Validator::kindName(ValidationIssue::Kind kind) {
    switch (kind) {
        case ValidationIssue::EMPTY_SCRIPT:        return "empty-script";
        case ValidationIssue::MISSING_START:       return "missing-start";
        case ValidationIssue::MARKER_BEFORE_START: return "marker-before-start";
        case ValidationIssue::EMPTY_START:         return "empty-start";
        case ValidationIssue::TOP_LEVEL_BLOCK:     return "top-level-block";
        case ValidationIssue::MISSING_END:         return "missing-end";
        case ValidationIssue::END_NOT_LAST:        return "end-not-last";
        case ValidationIssue::DUPLICATE_MARKER:    return "duplicate-marker";
        case ValidationIssue::CONSECUTIVE_MARKERS: return "consecutive-markers";
        case ValidationIssue::INVALID_COMMAND:     return "invalid-command";
        case ValidationIssue::LEAF_CHOICE:         return "leaf-choice";
        case ValidationIssue::UNDEFINED_MARKER:    return "undefined-marker";
        case ValidationIssue::UNREACHABLE_CODE:    return "unreachable-code";
        case ValidationIssue::UNKNOWN_COMMAND:     return "unknown-command";
        case ValidationIssue::ORPHAN_BLOCK:        return "orphan-block";
    }
    return "?";
}

void Validator::printReport(const ValidationReport& report, std::ostream& out) {
    out << "=== Daesa Validation Report ===\n\n";

    out << "[Summary]\n";
    out << "  Commands: " << report.commandCount << "\n";
    out << "  Markers: " << report.markerCount << "\n";
    out << "  Comments: " << report.commentCount << "\n";
    out << "  Max block depth: " << report.maxDepth << "\n";
    out << "\n";

    int errors = report.errorCount();
    int warnings = report.warningCount();

    if (errors > 0) {
        out << "[Errors]\n";
        for (const auto& issue : report.issues) {
            if (issue.level == ValidationIssue::ERROR) {
                out << "  E: line " << issue.line << ": " << issue.detail
                    << " [" << kindName(issue.kind) << "]\n";
            }
        }
        out << "\n";
    }

    if (warnings > 0) {
        out << "[Warnings]\n";
        for (const auto& issue : report.issues) {
            if (issue.level == ValidationIssue::WARNING) {
                out << "  W: line " << issue.line << ": " << issue.detail
                    << " [" << kindName(issue.kind) << "]\n";
            }
        }
        out << "\n";
    }

    if (errors == 0 && warnings == 0) {
        out << "No issues found.\n";
    }
}

} // namespace Daesa
