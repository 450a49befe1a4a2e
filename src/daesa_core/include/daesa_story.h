#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace Daesa {
    // 컴파일된 스크립트(.dsb) 로더
    class Story {
    public:
        // .dsb 파일을 로드하고 검증한다. 성공 시 true 반환.
        bool loadFromFile(const std::string& filepath);
        // 메모리 버퍼를 복사해 로드 (검증 포함)
        bool loadFromBuffer(const uint8_t* data, size_t size);

        // 로드된 스크립트를 콘솔에 출력한다.
        void printScript() const;

        // Engine이 버퍼에 접근하기 위한 접근자
        const uint8_t* getBuffer() const { return buffer_.data(); }
        size_t getBufferSize() const { return buffer_.size(); }
        bool isLoaded() const { return !buffer_.empty(); }

    private:
        std::vector<uint8_t> buffer_;
    };
}
