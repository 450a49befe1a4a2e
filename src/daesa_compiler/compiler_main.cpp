#include "daesa_parser.h"
#include "daesa_validator.h"
#include "daesa_json_export.h"
#include <iostream>
#include <fstream>
#include <string>
#include <cstring>

static const char* VERSION = "0.1.0";

static void printUsage() {
    std::cout << "Daesa Compiler v" << VERSION << "\n"
              << "Usage: DaesaCompiler <input.script> [-o output.dsb]\n"
              << "\n"
              << "Options:\n"
              << "  -o <path>    Output file path (default: script.dsb)\n"
              << "  --check      Validate only and print a report (no output file)\n"
              << "  --format     Print the normalized script to stdout\n"
              << "  --export-json <path>  Export the document as JSON IR\n"
              << "  --export-tree <path>  Export the built state tree as JSON\n"
              << "  --unknown-commands <allow|warn|deny>  Unknown command rule (default: deny)\n"
              << "  --top-level-block <allow|warn|deny>   Block right after %START% (default: allow)\n"
              << "  --config <path>  Load validator options from a JSON file\n"
              << "  -h, --help   Show this help message\n"
              << "  --version    Show version number\n";
}

static bool writeTextFile(const std::string& path, const std::string& text) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) return false;
    ofs << text << "\n";
    return true;
}

int main(int argc, char* argv[]) {
    // help/version 플래그 체크 (위치 무관)
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            printUsage();
            return 0;
        }
        if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << "DaesaCompiler " << VERSION << std::endl;
            return 0;
        }
    }

    if (argc < 2) {
        printUsage();
        return 1;
    }

    std::string inputPath = argv[1];
    std::string outputPath = "script.dsb";
    std::string exportJsonPath;
    std::string exportTreePath;
    std::string configPath;
    std::string unknownCommandsArg;
    std::string topLevelBlockArg;
    bool explicitOutput = false;
    bool checkOnly = false;
    bool doFormat = false;

    // 옵션 파싱
    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            outputPath = argv[++i];
            explicitOutput = true;
        } else if (std::strcmp(argv[i], "--check") == 0) {
            checkOnly = true;
        } else if (std::strcmp(argv[i], "--format") == 0) {
            doFormat = true;
        } else if (std::strcmp(argv[i], "--export-json") == 0 && i + 1 < argc) {
            exportJsonPath = argv[++i];
        } else if (std::strcmp(argv[i], "--export-tree") == 0 && i + 1 < argc) {
            exportTreePath = argv[++i];
        } else if (std::strcmp(argv[i], "--unknown-commands") == 0 && i + 1 < argc) {
            unknownCommandsArg = argv[++i];
        } else if (std::strcmp(argv[i], "--top-level-block") == 0 && i + 1 < argc) {
            topLevelBlockArg = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configPath = argv[++i];
        } else {
            std::cerr << "error: unknown option: " << argv[i] << std::endl;
            return 1;
        }
    }

    // 검증 옵션: 설정 파일 → CLI 플래그 순으로 적용
    Daesa::ValidatorOptions options;
    if (!configPath.empty()) {
        std::string configError;
        if (!options.loadFromFile(configPath, configError)) {
            std::cerr << "error: " << configError << std::endl;
            return 1;
        }
    }
    if (!unknownCommandsArg.empty() &&
        !Daesa::parseRuleSeverity(unknownCommandsArg, options.unknownCommands)) {
        std::cerr << "error: invalid --unknown-commands value: " << unknownCommandsArg << std::endl;
        return 1;
    }
    if (!topLevelBlockArg.empty() &&
        !Daesa::parseRuleSeverity(topLevelBlockArg, options.topLevelBlock)) {
        std::cerr << "error: invalid --top-level-block value: " << topLevelBlockArg << std::endl;
        return 1;
    }

    Daesa::Parser parser;

    if (!parser.parse(inputPath)) {
        const auto& errors = parser.getErrors();
        for (const auto& err : errors) {
            std::cerr << "error: " << err << std::endl;
        }
        std::cerr << "\n" << errors.size() << " error(s). Compilation aborted." << std::endl;
        return 1;
    }

    // 의미 검증
    Daesa::Validator validator;
    auto report = validator.validate(parser.getDocument(), options);

    if (checkOnly) {
        Daesa::Validator::printReport(report, std::cout);
        return report.hasErrors() ? 1 : 0;
    }

    for (const auto& issue : report.issues) {
        const char* label = issue.level == Daesa::ValidationIssue::ERROR ? "error: " : "warning: ";
        std::cerr << label << inputPath << ":" << issue.line << ": " << issue.detail << std::endl;
    }
    if (report.hasErrors()) {
        std::cerr << "\n" << report.errorCount() << " error(s). Compilation aborted." << std::endl;
        return 1;
    }

    // --format이면 stdout은 스크립트 전용, 상태 메시지는 stderr로
    std::ostream& status = doFormat ? std::cerr : std::cout;

    // 정규화된 스크립트 출력 (--format)
    if (doFormat) {
        std::cout << parser.getDocument().toString();
    }

    // JSON IR (--export-json, --export-tree)
    if (!exportJsonPath.empty()) {
        if (!writeTextFile(exportJsonPath, Daesa::JsonExport::toJsonString(parser.getDocument()))) {
            std::cerr << "Failed to write JSON IR: " << exportJsonPath << std::endl;
            return 1;
        }
        status << "JSON IR: " << exportJsonPath << std::endl;
    }
    if (!exportTreePath.empty()) {
        auto stateTree = Daesa::TreeBuilder::build(parser.getDocument());
        if (!writeTextFile(exportTreePath, Daesa::JsonExport::treeToJsonString(stateTree))) {
            std::cerr << "Failed to write state tree JSON: " << exportTreePath << std::endl;
            return 1;
        }
        status << "State tree JSON: " << exportTreePath << std::endl;
    }

    // 요청된 출력만 생성 (-o가 명시된 경우는 컴파일도 수행)
    if ((doFormat || !exportJsonPath.empty() || !exportTreePath.empty()) && !explicitOutput) {
        return 0;
    }

    if (!parser.compile(outputPath, status)) {
        const auto& errors = parser.getErrors();
        for (const auto& err : errors) {
            std::cerr << "error: " << err << std::endl;
        }
        std::cerr << "\n" << errors.size() << " error(s). Compilation failed." << std::endl;
        return 1;
    }

    return 0;
}
