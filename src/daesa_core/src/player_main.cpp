#include "daesa_story.h"
#include "daesa_engine.h"
#include <iostream>
#include <string>

static void printUsage() {
    std::cout << "Usage: DaesaPlayer <script.dsb> [--dump]" << std::endl;
}

// 선택지 텍스트 (접미사 그대로)
static std::string choiceText(const Daesa::Command& command) {
    return command.hasSuffix ? command.suffix : command.name;
}

int main(int argc, char* argv[]) {
    std::string filepath;
    bool dump = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--dump") {
            dump = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (filepath.empty()) {
            filepath = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printUsage();
            return 1;
        }
    }
    if (filepath.empty()) filepath = "script.dsb";

    // .dsb 파일 로드
    Daesa::Story story;
    if (!story.loadFromFile(filepath)) {
        return 1;
    }

    if (dump) {
        story.printScript();
        return 0;
    }

    // Engine 시작
    Daesa::Engine engine;
    if (!engine.start(story.getBuffer(), story.getBufferSize())) {
        if (engine.getError().hasError()) {
            std::cerr << "Failed to start engine: " << engine.getError().message << std::endl;
            return 1;
        }
        std::cout << "(empty script)" << std::endl;
        return 0;
    }

    std::cout << "\n=== Daesa Player ===" << std::endl;
    std::cout << std::endl;

    // 콘솔 플레이 루프
    while (!engine.isFinished()) {
        if (engine.isAwaitingChoice()) {
            auto choices = engine.getPendingChoices();
            for (size_t i = 0; i < choices.size(); ++i) {
                std::cout << "  [" << (i + 1) << "] " << choiceText(choices[i]) << std::endl;
            }
            std::cout << std::endl;

            // 사용자 입력
            int input = 0;
            while (true) {
                std::cout << "> ";
                if (!(std::cin >> input)) {
                    std::cout << std::endl << "=== STOPPED ===" << std::endl;
                    return 0;
                }
                if (input >= 1 && input <= static_cast<int>(choices.size())) {
                    break;
                }
                std::cout << "1~" << choices.size()
                          << " 사이의 번호를 입력하세요." << std::endl;
            }
            std::cout << std::endl;
            if (!engine.choose(input - 1)) {
                std::cerr << "error: " << engine.getError().message << std::endl;
                return 1;
            }
            continue;
        }

        Daesa::Tick tick;
        if (!engine.tick(tick)) {
            std::cerr << "error: " << engine.getError().message << std::endl;
            return 1;
        }

        for (const auto& command : tick.commands) {
            if (command.isSpeech()) {
                if (command.hasPrefix) {
                    std::cout << command.prefix << ": " << command.suffix << std::endl;
                } else {
                    std::cout << command.suffix << std::endl;
                }
                std::cout << std::endl;
            } else if (command.isChoice()) {
                // 선택지 줄은 메뉴로 보여주므로 따로 출력하지 않는다
            } else if (command.isJump()) {
                std::string target = Daesa::jumpTarget(command);
                if (!engine.gotoMarker(target)) {
                    std::cerr << "error: " << engine.getError().message << std::endl;
                    return 1;
                }
            } else {
                std::cout << "[CMD] " << command.toString() << std::endl;
                std::cout << std::endl;
            }
        }
    }

    std::cout << "=== END ===" << std::endl;
    return 0;
}
