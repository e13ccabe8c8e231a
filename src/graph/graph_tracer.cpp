#include <mediadex/graph/graph_tracer.h>
#include <mediadex/graph/node_types.h>

namespace mediadex::graph {

const Node* GraphTracer::trace(std::string_view start, std::string_view inputName,
                               std::span<const std::string_view> stopAt, int maxHops) const {
    std::string current(start);
    for (int hop = 0; hop < maxHops; ++hop) {
        const Node* node = doc_.find(current);
        if (!node) {
            return nullptr;
        }
        if (!stopAt.empty() && containsType(stopAt, doc_.nodeType(*node))) {
            return node;
        }
        auto conn = doc_.connection(*node, inputName);
        if (!conn || conn->node.empty()) {
            return node;
        }
        current = conn->node;
    }
    return nullptr;
}

std::optional<nlohmann::json> GraphTracer::valueOf(const Node* node, std::string_view param) const {
    if (!node) {
        return std::nullopt;
    }
    if (auto direct = doc_.widgetValue(*node, param)) {
        return direct;
    }
    const Node* source = doc_.inputSource(*node, param);
    if (source && doc_.nodeType(*source).starts_with(kPrimitivePrefix)) {
        return doc_.widgetValue(*source, "value");
    }
    return std::nullopt;
}

} // namespace mediadex::graph
