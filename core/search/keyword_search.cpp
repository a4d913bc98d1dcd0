#include "search/keyword_search.hpp"
#include "store/record_codec.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"
#include "common/text.hpp"
#include "common/validation.hpp"

#include <algorithm>

namespace kgraph {

namespace {

std::optional<int> rankLabel(const std::string& label, const std::string& needle) {
    if (equalsFolded(label, needle)) return kExactLabel;
    if (startsWithFolded(label, needle)) return kLabelPrefix;
    if (containsFolded(label, needle)) return kLabelSubstring;
    return std::nullopt;
}

RecordFilter containsAny(const std::string& needle, std::vector<std::string> fields) {
    RecordFilter filter;
    filter.contains = needle;
    filter.contains_fields = std::move(fields);
    return filter;
}

} // namespace

// ─── DefaultSearchPolicy ───────────────────────────────────────

RecordFilter DefaultSearchPolicy::nodeCandidates(const std::string& needle) const {
    return containsAny(needle, {"name", "type", "properties"});
}

RecordFilter DefaultSearchPolicy::edgeCandidates(const std::string& needle) const {
    return containsAny(needle, {"relation_type", "edge_id", "properties"});
}

std::optional<int> DefaultSearchPolicy::rankNode(const Node& node, const std::string& needle) const {
    if (auto tier = rankLabel(node.name, needle)) return tier;
    if (node.type && containsFolded(*node.type, needle)) return kSecondaryField;
    if (containsFolded(stringifyProperties(node.properties), needle)) return kPropertyMatch;
    return std::nullopt;
}

std::optional<int> DefaultSearchPolicy::rankEdge(const Edge& edge, const std::string& needle) const {
    if (edge.relation_type) {
        if (auto tier = rankLabel(*edge.relation_type, needle)) return tier;
    }
    if (containsFolded(edge.id, needle)) return kSecondaryField;
    if (containsFolded(stringifyProperties(edge.properties), needle)) return kPropertyMatch;
    return std::nullopt;
}

// ─── KeywordSearch ─────────────────────────────────────────────

KeywordSearch::KeywordSearch(const RecordStore& store, const EngineConfig& config)
    : store_(store), config_(config), policy_(std::make_unique<DefaultSearchPolicy>()) {}

void KeywordSearch::setPolicy(std::unique_ptr<SearchPolicy> policy) {
    if (!policy) {
        throw ValidationError("policy", "must not be null");
    }
    policy_ = std::move(policy);
}

std::string KeywordSearch::checkedNeedle(const std::string& keyword, int limit) const {
    requireRange(limit, config_.max_search_limit, "limit");
    std::string needle = toLower(trim(keyword));
    if (needle.empty()) {
        throw ValidationError("keyword", "must not be empty");
    }
    return needle;
}

std::vector<NodeHit> KeywordSearch::searchNodes(const std::string& collection,
                                                const std::string& keyword, int limit) const {
    std::string needle = checkedNeedle(keyword, limit);

    std::vector<NodeHit> hits;
    for (const auto& record : store_.list(collection, RecordKind::Node,
                                          policy_->nodeCandidates(needle))) {
        Node node = decodeStoredNode(record);
        if (auto tier = policy_->rankNode(node, needle)) {
            hits.push_back({std::move(node), *tier});
        }
    }

    std::sort(hits.begin(), hits.end(), [](const NodeHit& a, const NodeHit& b) {
        if (a.tier != b.tier) return a.tier < b.tier;
        return a.node.id < b.node.id;
    });
    if (hits.size() > static_cast<size_t>(limit)) hits.resize(limit);

    logger()->debug("{}: node search '{}' -> {} hit(s)", collection, keyword, hits.size());
    return hits;
}

std::vector<EdgeHit> KeywordSearch::searchEdges(const std::string& collection,
                                                const std::string& keyword, int limit) const {
    std::string needle = checkedNeedle(keyword, limit);

    std::vector<EdgeHit> hits;
    for (const auto& record : store_.list(collection, RecordKind::Edge,
                                          policy_->edgeCandidates(needle))) {
        Edge edge = decodeStoredEdge(record);
        if (auto tier = policy_->rankEdge(edge, needle)) {
            hits.push_back({std::move(edge), *tier});
        }
    }

    std::sort(hits.begin(), hits.end(), [](const EdgeHit& a, const EdgeHit& b) {
        if (a.tier != b.tier) return a.tier < b.tier;
        return a.edge.id < b.edge.id;
    });
    if (hits.size() > static_cast<size_t>(limit)) hits.resize(limit);

    logger()->debug("{}: edge search '{}' -> {} hit(s)", collection, keyword, hits.size());
    return hits;
}

} // namespace kgraph
