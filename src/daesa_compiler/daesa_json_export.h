#pragma once
#include "daesa_builder.h"
#include "daesa_document.h"
#include <nlohmann/json.hpp>
#include <string>

namespace Daesa {

/**
 * JSON IR export for Daesa scripts.
 *
 * Converts a parsed Document, or the state tree built from it, to a
 * human-readable JSON representation for external tools that need to
 * consume scripts without a FlatBuffers dependency.
 */
class JsonExport {
public:
    static constexpr int FORMAT_VERSION = 1;

    /// Convert a Document to a JSON object (structure and source lines)
    static nlohmann::json toJson(const Document& document);

    /// Convert a built StateTree to a JSON object (nodes, links, markers)
    static nlohmann::json treeToJson(const StateTree& stateTree);

    /// Pretty-printed variants
    static std::string toJsonString(const Document& document, int indent = 2);
    static std::string treeToJsonString(const StateTree& stateTree, int indent = 2);

private:
    static nlohmann::json serializeElements(const std::vector<Element>& elements);
    static nlohmann::json serializeElement(const Element& element);
    static nlohmann::json serializeCommand(const Command& command);
    static nlohmann::json nodeIdToJson(NodeId id);
};

} // namespace Daesa
