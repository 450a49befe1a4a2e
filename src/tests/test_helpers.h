#pragma once
#include "daesa_parser.h"
#include "daesa_validator.h"
#include "daesa_builder.h"
#include "daesa_engine.h"
#include <string>
#include <vector>
#include <fstream>
#include <cstdio>

namespace DaesaTest {

// 스크립트 문자열 → Document (파싱 실패 시 빈 문서)
inline Daesa::Document parseScript(const std::string& script) {
    Daesa::Parser parser;
    if (!parser.parseString(script)) return Daesa::Document();
    return parser.takeDocument();
}

// 스크립트 문자열 → 검증 리포트
inline Daesa::ValidationReport validateScript(
    const std::string& script,
    const Daesa::ValidatorOptions& options = Daesa::ValidatorOptions())
{
    Daesa::Validator validator;
    return validator.validate(parseScript(script), options);
}

// 스크립트 문자열 → 컴파일 → .dsb 바이너리 벡터 반환
inline std::vector<uint8_t> compileScript(const std::string& script) {
    // 임시 파일에 스크립트 저장
    std::string inPath = "test_tmp_in.script";
    std::string outPath = "test_tmp_out.dsb";

    {
        std::ofstream ofs(inPath);
        ofs << script;
    }

    Daesa::Parser parser;
    if (!parser.parse(inPath)) {
        std::remove(inPath.c_str());
        return {};
    }
    if (!parser.compile(outPath)) {
        std::remove(inPath.c_str());
        return {};
    }

    // .dsb 읽기
    std::ifstream ifs(outPath, std::ios::binary | std::ios::ate);
    if (!ifs.is_open()) {
        std::remove(inPath.c_str());
        std::remove(outPath.c_str());
        return {};
    }
    auto size = ifs.tellg();
    ifs.seekg(0);
    std::vector<uint8_t> buf(static_cast<size_t>(size));
    ifs.read(reinterpret_cast<char*>(buf.data()), size);
    ifs.close();

    std::remove(inPath.c_str());
    std::remove(outPath.c_str());
    return buf;
}

// Engine을 스크립트 문자열로부터 바로 시작
inline bool startEngine(Daesa::Engine& engine, const std::string& script) {
    Daesa::Parser parser;
    if (!parser.parseString(script)) return false;
    return engine.start(parser.takeDocument());
}

// tick 한 번 → 첫 커맨드의 원문 ("A |SAY| hi"), 없으면 빈 문자열
inline std::string tickText(Daesa::Engine& engine) {
    Daesa::Tick tick;
    if (!engine.tick(tick) || tick.empty()) return "";
    return tick[0].toString();
}

// 선택지 없이 끝까지 tick 하며 내보낸 커맨드 원문 수집
inline std::vector<std::string> drain(Daesa::Engine& engine, size_t limit = 1000) {
    std::vector<std::string> out;
    for (size_t i = 0; i < limit && !engine.isFinished() && !engine.isAwaitingChoice(); ++i) {
        Daesa::Tick tick;
        if (!engine.tick(tick)) break;
        for (const auto& command : tick.commands) out.push_back(command.toString());
    }
    return out;
}

} // namespace DaesaTest
