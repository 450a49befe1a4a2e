#include "daesa_builder.h"
#include "daesa_generated.h"
#include <iostream>
#include <map>
#include <memory>

using namespace Daesa::Schema;

namespace Daesa {

static const char* SCRIPT_FORMAT_VERSION = "0.1.0";

// =================================================================
// Document → StateTree
// =================================================================
StateTree TreeBuilder::build(Document document) {
    StateTree result;
    TreeBuilder builder(result);
    builder.buildElements(document.elements, NodeId::None());

    // 문서 끝까지 커맨드를 만나지 못한 마커 (%END%)
    builder.bindPendingMarkers(NodeId::None());

    auto start = result.markers.find(START_MARKER_NAME);
    if (start != result.markers.end() && start->second.isValid()) {
        result.firstNode = start->second;
    } else {
        result.firstNode = result.tree.first();
    }
    return result;
}

void TreeBuilder::bindPendingMarkers(NodeId node) {
    for (auto& name : pendingMarkers_) {
        out_.markers[name] = node;
    }
    pendingMarkers_.clear();
}

// parent가 None이면 최상위 레벨
void TreeBuilder::buildElements(std::vector<Element>& elements, NodeId parent) {
    // 이 레벨에서 바로 앞에 온 커맨드 노드 (블록의 부모 후보)
    NodeId lastNode = NodeId::None();

    for (auto& el : elements) {
        switch (el.type) {
            case Element::LINE: {
                if (el.line.isMarker()) {
                    if (!pendingMarkers_.empty()) {
                        std::cerr << "[Daesa] warning: marker %" << el.line.marker.name
                                  << "% follows %" << pendingMarkers_.back()
                                  << "% without a command in between" << std::endl;
                    }
                    pendingMarkers_.push_back(el.line.marker.name);
                    lastNode = NodeId::None();
                    break;
                }

                NodeId id = parent.isValid()
                    ? out_.tree.pushWithParent(std::move(el.line.command), parent)
                    : out_.tree.push(std::move(el.line.command));
                bindPendingMarkers(id);
                lastNode = id;
                break;
            }
            case Element::BLOCK:
                // 커맨드 바로 아래 블록 → 그 커맨드의 자식들.
                // 마커 뒤(또는 맨 앞)의 블록은 부모가 없으므로 현재 레벨로 평탄화한다.
                buildElements(el.block.elements, lastNode.isValid() ? lastNode : parent);
                break;
            case Element::COMMENT:
                break;
        }
    }
}

// =================================================================
// StateTree ↔ .dsb
// =================================================================
std::vector<uint8_t> TreeBuilder::serialize(const StateTree& stateTree) {
    CompiledScriptT script;
    script.version = SCRIPT_FORMAT_VERSION;

    const auto& tree = stateTree.tree;
    for (size_t i = 0; i < tree.size(); ++i) {
        NodeId id = tree.idAt(i);
        const Command* command = tree.getById(id);

        auto instr = std::make_unique<InstructionT>();
        instr->name = command->name;
        instr->has_prefix = command->hasPrefix;
        instr->prefix = command->prefix;
        instr->has_suffix = command->hasSuffix;
        instr->suffix = command->suffix;

        auto node = std::make_unique<TreeNodeT>();
        node->instruction = std::move(instr);
        NodeId parent = tree.parentOf(id);
        node->parent = parent.isValid() ? static_cast<int32_t>(parent.index()) : -1;
        script.nodes.push_back(std::move(node));
    }

    // 같은 입력이면 같은 바이트가 나오도록 이름순 정렬
    std::map<std::string, NodeId> sortedMarkers(stateTree.markers.begin(), stateTree.markers.end());
    for (const auto& entry : sortedMarkers) {
        auto marker = std::make_unique<MarkerEntryT>();
        marker->name = entry.first;
        marker->node = entry.second.isValid() ? static_cast<int32_t>(entry.second.index()) : -1;
        script.markers.push_back(std::move(marker));
    }

    script.first_node = stateTree.firstNode.isValid()
        ? static_cast<int32_t>(stateTree.firstNode.index()) : -1;

    flatbuffers::FlatBufferBuilder builder;
    auto rootOffset = CompiledScript::Pack(builder, &script);
    FinishCompiledScriptBuffer(builder, rootOffset);

    return std::vector<uint8_t>(builder.GetBufferPointer(),
                                builder.GetBufferPointer() + builder.GetSize());
}

static std::string fbString(const flatbuffers::String* s) {
    return s ? s->str() : std::string();
}

bool TreeBuilder::deserialize(const uint8_t* buffer, size_t size,
                              StateTree& out, std::string& error) {
    if (!buffer || size == 0) {
        error = "empty buffer";
        return false;
    }

    flatbuffers::Verifier verifier(buffer, size);
    if (!CompiledScriptBufferHasIdentifier(buffer) || !VerifyCompiledScriptBuffer(verifier)) {
        error = "invalid compiled script buffer";
        return false;
    }

    const auto* script = GetCompiledScript(buffer);
    StateTree result;

    const auto* nodes = script->nodes();
    if (nodes) {
        for (flatbuffers::uoffset_t i = 0; i < nodes->size(); ++i) {
            const auto* node = nodes->Get(i);
            const auto* instr = node->instruction();
            if (!instr) {
                error = "node " + std::to_string(i) + " has no instruction";
                return false;
            }

            Command command;
            command.name = fbString(instr->name());
            command.hasPrefix = instr->has_prefix();
            command.prefix = fbString(instr->prefix());
            command.hasSuffix = instr->has_suffix();
            command.suffix = fbString(instr->suffix());

            int32_t parent = node->parent();
            if (parent < 0) {
                result.tree.push(std::move(command));
            } else if (static_cast<flatbuffers::uoffset_t>(parent) < i) {
                result.tree.pushWithParent(std::move(command), result.tree.idAt(static_cast<size_t>(parent)));
            } else {
                // 부모는 항상 자식보다 먼저 직렬화된다
                error = "node " + std::to_string(i) + " refers to a parent that does not precede it";
                return false;
            }
        }
    }

    const auto* markers = script->markers();
    if (markers) {
        for (flatbuffers::uoffset_t i = 0; i < markers->size(); ++i) {
            const auto* marker = markers->Get(i);
            int32_t node = marker->node();
            if (node >= static_cast<int32_t>(result.tree.size())) {
                error = "marker %" + fbString(marker->name()) + "% refers to a missing node";
                return false;
            }
            result.markers[fbString(marker->name())] =
                node < 0 ? NodeId::None() : result.tree.idAt(static_cast<size_t>(node));
        }
    }

    int32_t first = script->first_node();
    result.firstNode = (first >= 0) ? result.tree.idAt(static_cast<size_t>(first)) : NodeId::None();

    out = std::move(result);
    return true;
}

} // namespace Daesa
