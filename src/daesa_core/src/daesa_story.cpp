#include "daesa_story.h"
#include "daesa_generated.h"
#include <iostream>
#include <fstream>

using namespace Daesa::Schema;

namespace Daesa {

bool Story::loadFromFile(const std::string& filepath) {
    std::ifstream ifs(filepath, std::ios::binary | std::ios::ate);
    if (!ifs.is_open()) {
        std::cerr << "[Daesa] Failed to open file: " << filepath << std::endl;
        return false;
    }

    auto size = ifs.tellg();
    ifs.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(static_cast<size_t>(size));
    ifs.read(reinterpret_cast<char*>(data.data()), size);
    ifs.close();

    if (!loadFromBuffer(data.data(), data.size())) {
        std::cerr << "[Daesa] Invalid .dsb file: " << filepath << std::endl;
        return false;
    }

    std::cout << "[Daesa] Loaded: " << filepath
              << " (" << buffer_.size() << " bytes)" << std::endl;
    return true;
}

bool Story::loadFromBuffer(const uint8_t* data, size_t size) {
    buffer_.clear();
    if (!data || size == 0) return false;

    // FlatBuffers 버퍼 검증
    flatbuffers::Verifier verifier(data, size);
    if (!CompiledScriptBufferHasIdentifier(data) || !VerifyCompiledScriptBuffer(verifier)) {
        return false;
    }

    buffer_.assign(data, data + size);
    return true;
}

static const char* strOr(const flatbuffers::String* s, const char* fallback) {
    return s ? s->c_str() : fallback;
}

void Story::printScript() const {
    if (buffer_.empty()) {
        std::cerr << "[Daesa] No script loaded." << std::endl;
        return;
    }

    const auto* script = GetCompiledScript(buffer_.data());

    // --- 기본 정보 ---
    std::cout << "=== Daesa Script ===" << std::endl;
    std::cout << "Version: " << strOr(script->version(), "?") << std::endl;
    std::cout << "First Node: " << script->first_node() << std::endl;

    // --- Markers ---
    const auto* markers = script->markers();
    if (markers) {
        std::cout << "\n--- Markers (" << markers->size() << ") ---" << std::endl;
        for (flatbuffers::uoffset_t i = 0; i < markers->size(); ++i) {
            const auto* marker = markers->Get(i);
            std::cout << "  %" << strOr(marker->name(), "?") << "% -> ";
            if (marker->node() >= 0) {
                std::cout << marker->node() << std::endl;
            } else {
                std::cout << "(end of script)" << std::endl;
            }
        }
    }

    // --- Nodes ---
    const auto* nodes = script->nodes();
    if (!nodes) return;

    std::cout << "\n--- Nodes (" << nodes->size() << ") ---" << std::endl;

    for (flatbuffers::uoffset_t i = 0; i < nodes->size(); ++i) {
        const auto* node = nodes->Get(i);
        const auto* instr = node->instruction();

        std::cout << "  [" << i << "] ";
        if (node->parent() >= 0) {
            std::cout << "(parent " << node->parent() << ") ";
        }
        if (!instr) {
            std::cout << "(no instruction)" << std::endl;
            continue;
        }

        if (instr->has_prefix()) std::cout << strOr(instr->prefix(), "") << " ";
        std::cout << "|" << strOr(instr->name(), "?") << "|";
        if (instr->has_suffix()) std::cout << " " << strOr(instr->suffix(), "");
        std::cout << std::endl;
    }

    std::cout << "\n=== End ===" << std::endl;
}

} // namespace Daesa
