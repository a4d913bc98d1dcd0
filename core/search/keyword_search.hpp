#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"
#include "store/record_store.hpp"
#include "common/config.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kgraph {

/// Relevance tiers of the default policy; lower ranks first.
enum MatchTier : int {
    kExactLabel = 0,      // name (node) / relation_type (edge) equals keyword
    kLabelPrefix = 1,
    kLabelSubstring = 2,
    kSecondaryField = 3,  // node type / edge id
    kPropertyMatch = 4,
};

struct NodeHit {
    Node node;
    int tier = 0;
};

struct EdgeHit {
    Edge edge;
    int tier = 0;
};

/// Decides which records match a keyword and how they rank.
/// `needle` passed to the rank functions is trimmed and lowercased.
/// Results with equal rank are always ordered by id.
class SearchPolicy {
public:
    virtual ~SearchPolicy() = default;

    /// Store-side prefilter; must admit every record the rank function accepts.
    virtual RecordFilter nodeCandidates(const std::string& needle) const = 0;
    virtual RecordFilter edgeCandidates(const std::string& needle) const = 0;

    /// nullopt = no match.
    virtual std::optional<int> rankNode(const Node& node, const std::string& needle) const = 0;
    virtual std::optional<int> rankEdge(const Edge& edge, const std::string& needle) const = 0;
};

/// Case-insensitive substring matching over name, type and stringified
/// properties, ranked by MatchTier.
class DefaultSearchPolicy : public SearchPolicy {
public:
    RecordFilter nodeCandidates(const std::string& needle) const override;
    RecordFilter edgeCandidates(const std::string& needle) const override;
    std::optional<int> rankNode(const Node& node, const std::string& needle) const override;
    std::optional<int> rankEdge(const Edge& edge, const std::string& needle) const override;
};

class KeywordSearch {
public:
    KeywordSearch(const RecordStore& store, const EngineConfig& config);

    void setPolicy(std::unique_ptr<SearchPolicy> policy);

    /// Throws ValidationError for an empty keyword or limit outside
    /// [1, max_search_limit].
    std::vector<NodeHit> searchNodes(const std::string& collection,
                                     const std::string& keyword, int limit) const;

    std::vector<EdgeHit> searchEdges(const std::string& collection,
                                     const std::string& keyword, int limit) const;

private:
    std::string checkedNeedle(const std::string& keyword, int limit) const;

    const RecordStore& store_;
    const EngineConfig& config_;
    std::unique_ptr<SearchPolicy> policy_;
};

} // namespace kgraph
