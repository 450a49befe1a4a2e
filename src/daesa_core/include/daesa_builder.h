#pragma once
#include "daesa_document.h"
#include "daesa_tree.h"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace Daesa {

// --- 빌드 결과: 아레나 트리 + marker table + 시작 노드 ---
struct StateTree {
    ArenaTree<Command> tree;

    // 마커 이름 → 마커 다음 커맨드의 노드.
    // NodeId::None()이면 스크립트 끝 (뒤에 커맨드가 없는 %END% 등).
    std::unordered_map<std::string, NodeId> markers;

    // START 마커가 가리키는 노드, 없으면 첫 커맨드
    NodeId firstNode;

    bool empty() const { return tree.empty(); }
};

class TreeBuilder {
public:
    // Document를 깊이 우선으로 평탄화하여 트리 생성
    static StateTree build(Document document);

    // --- 컴파일된 형식 (.dsb, FlatBuffers) ---
    static std::vector<uint8_t> serialize(const StateTree& stateTree);
    // 버퍼 검증 후 트리 복원. 실패 시 false + error.
    static bool deserialize(const uint8_t* buffer, size_t size,
                            StateTree& out, std::string& error);

private:
    explicit TreeBuilder(StateTree& out) : out_(out) {}

    void buildElements(std::vector<Element>& elements, NodeId parent);
    void bindPendingMarkers(NodeId node);

    StateTree& out_;
    std::vector<std::string> pendingMarkers_; // 정상 스크립트에서는 최대 1개
};

} // namespace Daesa
