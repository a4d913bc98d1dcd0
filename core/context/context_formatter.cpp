#include "context/context_formatter.hpp"
#include "graph/properties.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace kgraph {

const char* const kNoKnowledgeSentinel = "No relevant knowledge found.";

namespace {

const std::string kHeader = "# Knowledge Graph Context";
const std::string kEntitiesHeading = "## Entities";
const std::string kRelationsHeading = "## Relations";

struct Item {
    size_t rank = 0;
    bool is_relation = false;
    std::string line;
    bool kept = true;
};

std::string formatWeight(double weight) {
    std::ostringstream out;
    out << weight;
    return out.str();
}

} // namespace

std::string ContextFormatter::entityLine(const Node& node) {
    std::string line = "- " + node.name;
    if (node.type) line += " (" + *node.type + ")";
    line += " [" + node.id + "]";

    if (node.properties.isObject() && !node.properties.empty()) {
        line += ": ";
        bool first = true;
        // Json::Value keeps members sorted, so keys print in lexical order
        for (const auto& key : node.properties.getMemberNames()) {
            if (!first) line += "; ";
            first = false;
            line += key + "=" + stringifyValue(node.properties[key]);
        }
    }
    return line;
}

std::string ContextFormatter::relationLine(const Edge& edge, const std::string& source_name,
                                           const std::string& target_name) {
    const std::string relation = edge.relation_type ? *edge.relation_type : "related_to";
    return "- " + source_name + " --" + relation + "--> " + target_name +
           " (weight " + formatWeight(edge.weight) + ")";
}

std::string ContextFormatter::format(const std::vector<Node>& ranked_nodes,
                                     const std::vector<Edge>& edges,
                                     int max_chars,
                                     const std::unordered_map<std::string, std::string>& names) const {
    if (max_chars <= 0) {
        throw ValidationError("max_chars", "must be positive");
    }
    const size_t budget = static_cast<size_t>(max_chars);

    // Ranks and display names of the listed nodes (first occurrence wins)
    std::unordered_map<std::string, size_t> rank_of;
    std::unordered_map<std::string, std::string> name_of;
    std::vector<Item> entities;
    for (const auto& node : ranked_nodes) {
        if (rank_of.count(node.id)) continue;
        rank_of.emplace(node.id, entities.size());
        name_of.emplace(node.id, node.name);
        entities.push_back({entities.size(), false, entityLine(node)});
    }
    const size_t unlisted_rank = entities.size();

    auto rankOf = [&](const std::string& id) {
        auto it = rank_of.find(id);
        return it == rank_of.end() ? unlisted_rank : it->second;
    };
    auto nameOf = [&](const std::string& id) -> const std::string& {
        auto it = name_of.find(id);
        if (it != name_of.end()) return it->second;
        auto ext = names.find(id);
        return ext != names.end() ? ext->second : id;
    };

    std::vector<const Edge*> ordered;
    std::unordered_set<std::string> seen_edges;
    for (const auto& edge : edges) {
        if (seen_edges.insert(edge.id).second) ordered.push_back(&edge);
    }
    std::sort(ordered.begin(), ordered.end(), [&](const Edge* a, const Edge* b) {
        size_t ra = std::max(rankOf(a->source), rankOf(a->target));
        size_t rb = std::max(rankOf(b->source), rankOf(b->target));
        if (ra != rb) return ra < rb;
        return a->id < b->id;
    });

    std::vector<Item> relations;
    relations.reserve(ordered.size());
    for (const Edge* edge : ordered) {
        relations.push_back({std::max(rankOf(edge->source), rankOf(edge->target)), true,
                             relationLine(*edge, nameOf(edge->source), nameOf(edge->target))});
    }

    // Running size of the rendered text; each line costs its length plus
    // one separator, and the first line has no separator before it.
    size_t entity_lines = entities.size();
    size_t relation_lines = relations.size();
    size_t body = 0;
    for (const auto& item : entities) body += item.line.size() + 1;
    for (const auto& item : relations) body += item.line.size() + 1;

    auto renderedSize = [&]() -> size_t {
        if (entity_lines == 0 && relation_lines == 0) return 0;
        size_t total = kHeader.size() + body;
        if (entity_lines > 0) total += kEntitiesHeading.size() + 1;
        if (relation_lines > 0) total += kRelationsHeading.size() + 1;
        return total;
    };

    // Keep order is (rank, entity before relation, listed order); items
    // are dropped from its far end.
    std::vector<Item*> drop_order;
    for (auto& item : entities) drop_order.push_back(&item);
    for (auto& item : relations) drop_order.push_back(&item);
    std::stable_sort(drop_order.begin(), drop_order.end(), [](const Item* a, const Item* b) {
        if (a->rank != b->rank) return a->rank < b->rank;
        return !a->is_relation && b->is_relation;
    });
    std::reverse(drop_order.begin(), drop_order.end());

    for (Item* item : drop_order) {
        if (renderedSize() <= budget) break;
        item->kept = false;
        body -= item->line.size() + 1;
        (item->is_relation ? relation_lines : entity_lines)--;
    }

    if (entity_lines == 0 && relation_lines == 0) {
        std::string sentinel = kNoKnowledgeSentinel;
        return sentinel.substr(0, budget);
    }

    std::string text = kHeader;
    if (entity_lines > 0) {
        text += "\n" + kEntitiesHeading;
        for (const auto& item : entities) {
            if (item.kept) text += "\n" + item.line;
        }
    }
    if (relation_lines > 0) {
        text += "\n" + kRelationsHeading;
        for (const auto& item : relations) {
            if (item.kept) text += "\n" + item.line;
        }
    }
    return text;
}

} // namespace kgraph
