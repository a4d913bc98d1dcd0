#include "common/validation.hpp"
#include "common/errors.hpp"

namespace kgraph {

void requireIdentifier(const std::string& value, const std::string& field, size_t max_len) {
    if (value.empty()) {
        throw ValidationError(field, "must not be empty");
    }
    if (value.size() > max_len) {
        throw ValidationError(field, "longer than " + std::to_string(max_len) + " bytes");
    }
}

void requireCollectionName(const std::string& collection, const EngineConfig& config) {
    requireIdentifier(collection, "collection", config.max_collection_name_length);
}

void requireRange(int value, int max, const std::string& field) {
    if (value < 1) {
        throw ValidationError(field, "must be at least 1, got " + std::to_string(value));
    }
    if (value > max) {
        throw ValidationError(field, "must be at most " + std::to_string(max) +
                                     ", got " + std::to_string(value));
    }
}

} // namespace kgraph
