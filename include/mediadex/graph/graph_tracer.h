#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string_view>
#include <mediadex/graph/graph_document.h>

namespace mediadex::graph {

/**
 * @brief Single-path backward traversal over a GraphDocument
 *
 * Each named input has exactly one source, so the tracer follows one chain
 * of connections rather than exploring every input of every node.
 */
class GraphTracer {
public:
    static constexpr int kDefaultMaxHops = 20;

    explicit GraphTracer(const GraphDocument& doc) : doc_(doc) {}

    /**
     * @brief Follow `inputName` backwards from `start`
     *
     * Returns the first node whose type is in `stopAt`, or the last node in
     * the chain when the input is a literal or unconnected. Returns nullptr
     * when a referenced node does not exist or the hop budget runs out.
     */
    const Node* trace(std::string_view start, std::string_view inputName,
                      std::span<const std::string_view> stopAt = {},
                      int maxHops = kDefaultMaxHops) const;

    /**
     * @brief Read a parameter, preferring the literal on `node`
     *
     * When the parameter has no literal and is wired to a primitive/constant
     * node, the primitive's own value is returned instead.
     */
    std::optional<nlohmann::json> valueOf(const Node* node, std::string_view param) const;

    const GraphDocument& document() const { return doc_; }

private:
    const GraphDocument& doc_;
};

} // namespace mediadex::graph
