#include <cmath>
#include <mediadex/graph/graph_document.h>
#include <mediadex/graph/node_types.h>

namespace mediadex::graph {

using nlohmann::json;

namespace {

int slotFrom(const json& value) {
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    return 0;
}

std::optional<json> nonNull(const json& value) {
    if (value.is_null()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

const char* variantName(GraphVariant variant) {
    switch (variant) {
        case GraphVariant::Linked:
            return "linked";
        case GraphVariant::Inline:
            return "inline";
    }
    return "unknown";
}

std::string idToString(const json& id) {
    if (id.is_string()) {
        return id.get<std::string>();
    }
    if (id.is_number_integer()) {
        return id.is_number_unsigned() ? std::to_string(id.get<uint64_t>())
                                       : std::to_string(id.get<int64_t>());
    }
    if (id.is_number_float()) {
        double d = id.get<double>();
        if (std::isfinite(d) && std::floor(d) == d && d >= -9.2233720368547758e18 &&
            d < 9.2233720368547758e18) {
            return std::to_string(static_cast<int64_t>(d));
        }
    }
    return id.dump();
}

Result<GraphDocument> GraphDocument::fromJson(const json& root) {
    if (!root.is_object()) {
        return Error{ErrorCode::UnrecognizedFormat, "graph root is not an object"};
    }
    auto nodesIt = root.find("nodes");
    if (nodesIt != root.end() && nodesIt->is_array()) {
        return fromLinked(root);
    }
    return fromInline(root);
}

Result<GraphDocument> GraphDocument::fromLinked(const json& root) {
    GraphDocument doc;
    doc.variant_ = GraphVariant::Linked;

    // link id -> (source node, source slot)
    std::map<std::string, Connection> links;
    if (auto it = root.find("links"); it != root.end() && it->is_array()) {
        for (const auto& link : *it) {
            if (link.is_array() && link.size() >= 3) {
                links[idToString(link[0])] = Connection{idToString(link[1]), slotFrom(link[2])};
            } else if (link.is_object() && link.contains("id") && link.contains("origin_id")) {
                links[idToString(link.at("id"))] =
                    Connection{idToString(link.at("origin_id")),
                               slotFrom(link.value("origin_slot", json()))};
            }
        }
    }

    const json* widgetMap = nullptr;
    if (auto it = root.find("widget_idx_map"); it != root.end() && it->is_object()) {
        widgetMap = &*it;
    }

    for (const auto& raw : root.at("nodes")) {
        if (!raw.is_object() || !raw.contains("id")) {
            continue;
        }
        Node node;
        node.id = idToString(raw["id"]);
        if (auto t = raw.find("type"); t != raw.end() && t->is_string()) {
            node.type = t->get<std::string>();
        }

        if (auto ins = raw.find("inputs"); ins != raw.end() && ins->is_array()) {
            for (const auto& input : *ins) {
                if (!input.is_object()) {
                    continue;
                }
                auto name = input.find("name");
                if (name == input.end() || !name->is_string()) {
                    continue;
                }
                auto key = name->get<std::string>();
                if (node.inputs.contains(key)) {
                    continue;
                }
                auto linkId = input.find("link");
                if (linkId == input.end() || linkId->is_null()) {
                    continue;
                }
                if (auto l = links.find(idToString(*linkId)); l != links.end()) {
                    node.inputs.emplace(std::move(key), l->second);
                }
            }
        }

        if (auto wv = raw.find("widgets_values"); wv != raw.end() && wv->is_array()) {
            node.widgetValues.assign(wv->begin(), wv->end());
        }

        if (widgetMap) {
            if (auto m = widgetMap->find(node.id); m != widgetMap->end() && m->is_object()) {
                for (const auto& [param, index] : m->items()) {
                    if (index.is_number_integer() && index.get<int64_t>() >= 0) {
                        node.widgetIndex[param] = static_cast<size_t>(index.get<int64_t>());
                    }
                }
            }
        }

        doc.nodes_[node.id] = std::move(node);
    }
    return doc;
}

Result<GraphDocument> GraphDocument::fromInline(const json& root) {
    GraphDocument doc;
    doc.variant_ = GraphVariant::Inline;
    bool sawTypedNode = false;

    for (const auto& [key, raw] : root.items()) {
        if (!raw.is_object()) {
            continue;
        }
        Node node;
        node.id = key;
        if (auto t = raw.find("class_type"); t != raw.end()) {
            sawTypedNode = true;
            if (t->is_string()) {
                node.type = t->get<std::string>();
            }
        }
        if (auto ins = raw.find("inputs"); ins != raw.end() && ins->is_object()) {
            for (const auto& [name, value] : ins->items()) {
                if (value.is_array()) {
                    if (!value.empty()) {
                        node.inputs.emplace(
                            name, Connection{idToString(value[0]),
                                             value.size() > 1 ? slotFrom(value[1]) : 0});
                    }
                    continue;
                }
                node.inputs.emplace(name, Literal{value});
            }
        }
        doc.nodes_[node.id] = std::move(node);
    }

    if (!sawTypedNode) {
        return Error{ErrorCode::UnrecognizedFormat, "no node carries a class_type"};
    }
    return doc;
}

const Node* GraphDocument::find(std::string_view id) const {
    auto it = nodes_.find(std::string(id));
    return it == nodes_.end() ? nullptr : &it->second;
}

std::optional<Connection> GraphDocument::connection(const Node& node,
                                                    std::string_view inputName) const {
    auto it = node.inputs.find(inputName);
    if (it == node.inputs.end()) {
        return std::nullopt;
    }
    if (const auto* conn = std::get_if<Connection>(&it->second)) {
        return *conn;
    }
    return std::nullopt;
}

const Node* GraphDocument::inputSource(const Node& node, std::string_view inputName) const {
    auto conn = connection(node, inputName);
    if (!conn) {
        return nullptr;
    }
    return find(conn->node);
}

std::optional<json> GraphDocument::widgetValue(const Node& node, std::string_view paramName) const {
    if (variant_ == GraphVariant::Inline) {
        auto it = node.inputs.find(paramName);
        if (it == node.inputs.end()) {
            return std::nullopt;
        }
        if (const auto* lit = std::get_if<Literal>(&it->second)) {
            return nonNull(lit->value);
        }
        return std::nullopt;
    }

    if (auto it = node.widgetIndex.find(paramName); it != node.widgetIndex.end()) {
        if (it->second < node.widgetValues.size()) {
            return nonNull(node.widgetValues[it->second]);
        }
    }

    const auto& table = positionalWidgetTable();
    auto layout = table.find(node.type);
    if (layout == table.end()) {
        return std::nullopt;
    }
    auto pos = layout->second.find(paramName);
    if (pos == layout->second.end() || pos->second >= node.widgetValues.size()) {
        return std::nullopt;
    }
    return nonNull(node.widgetValues[pos->second]);
}

} // namespace mediadex::graph
