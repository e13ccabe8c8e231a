#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <mediadex/core/types.h>

namespace mediadex::graph {

using NodeId = std::string;

/// Input carrying a value directly
struct Literal {
    nlohmann::json value;
};

/// Input wired to the output slot of another node
struct Connection {
    NodeId node;
    int slot = 0;
};

using InputRef = std::variant<Literal, Connection>;

enum class GraphVariant {
    Linked, ///< top-level node array plus a separate link table
    Inline  ///< map of node id to node, connections embedded as [id, slot]
};

const char* variantName(GraphVariant variant);

struct Node {
    NodeId id;
    std::string type;
    std::map<std::string, InputRef, std::less<>> inputs;
    std::vector<nlohmann::json> widgetValues;
    std::map<std::string, size_t, std::less<>> widgetIndex;
};

/**
 * @brief Normalized, immutable view of a generation graph
 *
 * Both wire serializations are resolved into the same Node shape when the
 * document is built. Traversal code only uses nodeType(), connection(),
 * inputSource() and widgetValue() and never looks at the variant.
 */
class GraphDocument {
public:
    /**
     * @brief Build a document from parsed JSON
     * @return UnrecognizedFormat when the root matches neither serialization
     */
    static Result<GraphDocument> fromJson(const nlohmann::json& root);

    GraphVariant variant() const { return variant_; }
    const std::map<NodeId, Node>& nodes() const { return nodes_; }
    size_t size() const { return nodes_.size(); }

    const Node* find(std::string_view id) const;

    const std::string& nodeType(const Node& node) const { return node.type; }

    /// The wired source of an input, or nullopt for literals and unconnected inputs
    std::optional<Connection> connection(const Node& node, std::string_view inputName) const;

    /// The node feeding an input, or nullptr if the input is not wired to a known node
    const Node* inputSource(const Node& node, std::string_view inputName) const;

    /// A literal parameter value, or nullopt when absent, null or wired
    std::optional<nlohmann::json> widgetValue(const Node& node, std::string_view paramName) const;

private:
    GraphDocument() = default;

    static Result<GraphDocument> fromLinked(const nlohmann::json& root);
    static Result<GraphDocument> fromInline(const nlohmann::json& root);

    GraphVariant variant_ = GraphVariant::Inline;
    std::map<NodeId, Node> nodes_;
};

/// Canonical string form of a node or link id (numbers without decoration)
std::string idToString(const nlohmann::json& id);

} // namespace mediadex::graph
