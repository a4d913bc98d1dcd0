#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace kgraph {

/// Returned when nothing relevant fits the budget.
extern const char* const kNoKnowledgeSentinel;

// ─── Context Formatter ────────────────────────────────────────
// Renders ranked query results as a bounded text block for prompt
// consumption:
//
//   # Knowledge Graph Context
//   ## Entities
//   - Alice (Person) [p1]: age=30; city=Paris
//   ## Relations
//   - Alice --knows--> Bob (weight 1)
//
// Lines are joined with '\n', no trailing newline.

class ContextFormatter {
public:
    /// `ranked_nodes` is best-first. An edge ranks with the worse of its
    /// endpoints; endpoints missing from `ranked_nodes` rank after all of
    /// them. Items are dropped lowest rank first (a relation before an
    /// entity of the same rank) until the text fits in max_chars bytes.
    /// `names` resolves endpoints that are not in `ranked_nodes`.
    /// Throws ValidationError if max_chars <= 0.
    std::string format(const std::vector<Node>& ranked_nodes,
                       const std::vector<Edge>& edges,
                       int max_chars,
                       const std::unordered_map<std::string, std::string>& names = {}) const;

    static std::string entityLine(const Node& node);
    static std::string relationLine(const Edge& edge, const std::string& source_name,
                                    const std::string& target_name);
};

} // namespace kgraph
