#pragma once
#include <cstdint>
#include <functional>
#include <iostream>
#include <utility>
#include <vector>

namespace Daesa {

// --- 불투명 노드 식별자 ---
// 트리 인스턴스마다 0부터 단조 증가하며 재사용되지 않는다.
class NodeId {
public:
    NodeId() = default;

    static NodeId None() { return NodeId(); }

    bool isValid() const { return value_ != INVALID; }
    uint32_t index() const { return value_; }

    bool operator==(const NodeId& other) const { return value_ == other.value_; }
    bool operator!=(const NodeId& other) const { return value_ != other.value_; }
    bool operator<(const NodeId& other) const { return value_ < other.value_; }

private:
    template <typename T> friend class ArenaTree;
    explicit NodeId(uint32_t value) : value_(value) {}

    static constexpr uint32_t INVALID = UINT32_MAX;
    uint32_t value_ = INVALID;
};

struct NodeIdHash {
    size_t operator()(const NodeId& id) const { return std::hash<uint32_t>()(id.index()); }
};

// --- Arena tree ---
// append-only 트리. 노드는 하나의 벡터에 모두 소유되고,
// 부모/자식/형제 관계는 식별자 기반 인접 목록으로만 표현한다.
// 최상위 노드(루트)들끼리도 삽입 순서대로 형제다.
template <typename T>
class ArenaTree {
public:
    // 루트 노드 추가
    NodeId push(T data) {
        NodeId id(nextId_++);
        branches_.push_back(Branch{id, std::move(data), NodeId::None(), roots_.size(), {}});
        roots_.push_back(id);
        return id;
    }

    // parent의 마지막 자식으로 추가. parent가 없으면 아무것도 추가하지 않고 None 반환.
    NodeId pushWithParent(T data, NodeId parent) {
        if (!contains(parent)) {
            std::cerr << "[Daesa] pushWithParent: parent node must already exist in tree" << std::endl;
            return NodeId::None();
        }
        NodeId id(nextId_++);
        size_t siblingIndex = branches_[parent.index()].children.size();
        branches_.push_back(Branch{id, std::move(data), parent, siblingIndex, {}});
        branches_[parent.index()].children.push_back(id);
        return id;
    }

    bool contains(NodeId id) const {
        return id.isValid() && id.index() < branches_.size();
    }

    const T* getById(NodeId id) const {
        return contains(id) ? &branches_[id.index()].data : nullptr;
    }

    // 직계 자식 (삽입 순서 = 문서 순서)
    const std::vector<NodeId>& childrenOf(NodeId id) const {
        static const std::vector<NodeId> empty;
        return contains(id) ? branches_[id.index()].children : empty;
    }

    NodeId parentOf(NodeId id) const {
        return contains(id) ? branches_[id.index()].parent : NodeId::None();
    }

    NodeId nextSiblingOf(NodeId id) const {
        if (!contains(id)) return NodeId::None();
        const Branch& b = branches_[id.index()];
        const std::vector<NodeId>& siblings = siblingsOf(b);
        size_t next = b.siblingIndex + 1;
        return next < siblings.size() ? siblings[next] : NodeId::None();
    }

    NodeId previousSiblingOf(NodeId id) const {
        if (!contains(id)) return NodeId::None();
        const Branch& b = branches_[id.index()];
        if (b.siblingIndex == 0) return NodeId::None();
        return siblingsOf(b)[b.siblingIndex - 1];
    }

    // 문서 순서상 다음 노드: 다음 형제, 없으면 부모의 다음 노드.
    // 뒤따르는 형제가 없는 루트에 도달하면 None.
    NodeId next(NodeId id) const {
        NodeId current = id;
        while (contains(current)) {
            NodeId sibling = nextSiblingOf(current);
            if (sibling.isValid()) return sibling;
            current = parentOf(current);
        }
        return NodeId::None();
    }

    NodeId first() const {
        return roots_.empty() ? NodeId::None() : roots_.front();
    }

    // 진단용 선형 탐색. 첫 번째로 일치하는 (식별자, 데이터). 없으면 (None, nullptr).
    template <typename Predicate>
    std::pair<NodeId, const T*> findBy(Predicate pred) const {
        for (const auto& b : branches_) {
            if (pred(b.data)) return std::make_pair(b.id, &b.data);
        }
        return std::make_pair(NodeId::None(), static_cast<const T*>(nullptr));
    }

    const std::vector<NodeId>& roots() const { return roots_; }
    size_t size() const { return branches_.size(); }
    bool empty() const { return branches_.empty(); }

    // 식별자 순서(= 생성 순서)의 n번째 노드
    NodeId idAt(size_t index) const {
        return index < branches_.size() ? branches_[index].id : NodeId::None();
    }

private:
    struct Branch {
        NodeId id;
        T data;
        NodeId parent;
        size_t siblingIndex; // 부모의 children (또는 roots_) 안에서의 위치
        std::vector<NodeId> children;
    };

    const std::vector<NodeId>& siblingsOf(const Branch& b) const {
        return b.parent.isValid() ? branches_[b.parent.index()].children : roots_;
    }

    std::vector<Branch> branches_;
    std::vector<NodeId> roots_;
    uint32_t nextId_ = 0;
};

} // namespace Daesa
