#pragma once

#include "common/config.hpp"

#include <string>

namespace kgraph {

/// Non-empty and at most max_len bytes, else ValidationError(field).
void requireIdentifier(const std::string& value, const std::string& field, size_t max_len);

void requireCollectionName(const std::string& collection, const EngineConfig& config);

/// 1 <= value <= max, else ValidationError(field).
void requireRange(int value, int max, const std::string& field);

} // namespace kgraph
