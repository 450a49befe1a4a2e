#include "daesa_json_export.h"
#include <map>

using json = nlohmann::json;

namespace Daesa {

static const char* FORMAT_NAME = "daesa-json-ir";
static const char* TREE_FORMAT_NAME = "daesa-json-tree";

// ============================================================
// Document serialization
// ============================================================

json JsonExport::serializeCommand(const Command& command) {
    json j;
    j["name"] = command.name;
    j["prefix"] = command.hasPrefix ? json(command.prefix) : json(nullptr);
    j["suffix"] = command.hasSuffix ? json(command.suffix) : json(nullptr);
    return j;
}

json JsonExport::serializeElement(const Element& element) {
    switch (element.type) {
    case Element::LINE:
        if (element.line.isMarker()) {
            return json{{"type", "marker"},
                        {"name", element.line.marker.name},
                        {"line", element.lineNum}};
        } else {
            json j = serializeCommand(element.line.command);
            j["type"] = "command";
            j["line"] = element.lineNum;
            return j;
        }
    case Element::COMMENT:
        return json{{"type", "comment"},
                    {"text", element.comment.text},
                    {"line", element.lineNum}};
    case Element::BLOCK:
        return json{{"type", "block"},
                    {"elements", serializeElements(element.block.elements)}};
    }
    return nullptr;
}

json JsonExport::serializeElements(const std::vector<Element>& elements) {
    json arr = json::array();
    for (const auto& el : elements) {
        arr.push_back(serializeElement(el));
    }
    return arr;
}

json JsonExport::toJson(const Document& document) {
    json j;
    j["format"] = FORMAT_NAME;
    j["format_version"] = FORMAT_VERSION;
    j["elements"] = serializeElements(document.elements);
    return j;
}

// ============================================================
// StateTree serialization
// ============================================================

json JsonExport::nodeIdToJson(NodeId id) {
    return id.isValid() ? json(id.index()) : json(nullptr);
}

json JsonExport::treeToJson(const StateTree& stateTree) {
    const auto& tree = stateTree.tree;

    json nodes = json::array();
    for (size_t i = 0; i < tree.size(); ++i) {
        NodeId id = tree.idAt(i);

        json children = json::array();
        for (NodeId child : tree.childrenOf(id)) {
            children.push_back(child.index());
        }

        json node;
        node["id"] = id.index();
        node["command"] = serializeCommand(*tree.getById(id));
        node["parent"] = nodeIdToJson(tree.parentOf(id));
        node["children"] = children;
        // 문서 순서상 다음 노드 (다음 형제 또는 조상의 다음 형제)
        node["next"] = nodeIdToJson(tree.next(id));
        nodes.push_back(node);
    }

    // 출력 순서 고정
    std::map<std::string, NodeId> sortedMarkers(stateTree.markers.begin(), stateTree.markers.end());
    json markers = json::object();
    for (const auto& entry : sortedMarkers) {
        markers[entry.first] = nodeIdToJson(entry.second);
    }

    json j;
    j["format"] = TREE_FORMAT_NAME;
    j["format_version"] = FORMAT_VERSION;
    j["first_node"] = nodeIdToJson(stateTree.firstNode);
    j["markers"] = markers;
    j["nodes"] = nodes;
    return j;
}

// ============================================================
// String helpers
// ============================================================

std::string JsonExport::toJsonString(const Document& document, int indent) {
    return toJson(document).dump(indent);
}

std::string JsonExport::treeToJsonString(const StateTree& stateTree, int indent) {
    return treeToJson(stateTree).dump(indent);
}

} // namespace Daesa
