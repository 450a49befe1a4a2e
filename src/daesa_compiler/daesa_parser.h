#pragma once
#include "daesa_document.h"
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace Daesa {

// 들여쓰기 기반 구조 파서. 텍스트 → Document (의미 검증은 Validator 담당)
class Parser {
public:
    // 스크립트 파일을 파싱하여 내부 Document 생성
    bool parse(const std::string& filepath);

    // 문자열에서 직접 파싱
    bool parseString(const std::string& source, const std::string& filename = "<string>");

    // 파싱된 문서를 트리로 빌드하여 .dsb 바이너리로 저장. 결과 요약은 log로 출력.
    bool compile(const std::string& outputPath, std::ostream& log = std::cout);

    // 파싱된 결과를 메모리 버퍼로 컴파일
    std::vector<uint8_t> compileToBuffer();

    // 첫 번째 에러 (하위 호환)
    const std::string& getError() const { return error_; }

    // 수집된 모든 에러
    const std::vector<std::string>& getErrors() const { return errors_; }
    bool hasErrors() const { return !errors_.empty(); }

    // 파싱 실패 시 빈 문서
    const Document& getDocument() const { return document_; }
    Document takeDocument() { return std::move(document_); }

    const std::string& getFilename() const { return filename_; }

private:
    // 들여쓰기 해석이 끝난 한 줄
    struct SourceLine {
        size_t level = 0;
        Element element;
    };

    Document document_;
    std::string error_;
    std::vector<std::string> errors_;
    std::string filename_;

    // 에러 수집 (계속 파싱)
    void addError(int lineNum, const std::string& msg);

    // 한 줄 내용(들여쓰기 제외) → Line/Comment 요소
    bool parseContent(const std::string& content, int lineNum, Element& out);
    bool parseMarkerLine(const std::string& content, int lineNum, Element& out);
    bool parseCommandLine(const std::string& content, int lineNum, Element& out);

    // 같은 level의 연속된 줄을 모으고, 더 깊은 줄은 Block으로 재귀
    static size_t collectElements(std::vector<SourceLine>& lines, size_t index,
                                  size_t level, std::vector<Element>& out);
};

} // namespace Daesa
