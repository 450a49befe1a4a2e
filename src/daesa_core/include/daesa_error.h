#pragma once
#include <string>

namespace Daesa {

enum class ErrorKind {
    NONE,
    PARSE_FAILURE,       // 텍스트 구조 오류 (문서 생성 안 됨)
    VALIDATION_FAILURE,  // 검증기가 거부한 스크립트
    ILLEGAL_STATE,       // 현재 상태에서 허용되지 않는 엔진 호출
    UNKNOWN_MARKER       // marker table에 없는 이름으로 goto
};

struct Error {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;

    bool hasError() const { return kind != ErrorKind::NONE; }
    void clear() { kind = ErrorKind::NONE; message.clear(); }
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:               return "None";
        case ErrorKind::PARSE_FAILURE:      return "ParseFailure";
        case ErrorKind::VALIDATION_FAILURE: return "ValidationFailure";
        case ErrorKind::ILLEGAL_STATE:      return "IllegalState";
        case ErrorKind::UNKNOWN_MARKER:     return "UnknownMarker";
    }
    return "?";
}

} // namespace Daesa
