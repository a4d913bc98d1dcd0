#include "common/errors.hpp"

namespace kgraph {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DuplicateId:      return "DuplicateIdError";
        case ErrorKind::NotFound:         return "NotFoundError";
        case ErrorKind::EndpointNotFound: return "EndpointNotFoundError";
        case ErrorKind::Validation:       return "ValidationError";
        case ErrorKind::Store:            return "StoreError";
    }
    return "GraphError";
}

GraphError::GraphError(ErrorKind kind, std::string subject, const std::string& message)
    : std::runtime_error(message), kind_(kind), subject_(std::move(subject)) {}

DuplicateIdError::DuplicateIdError(const std::string& entity, const std::string& id)
    : GraphError(ErrorKind::DuplicateId, id,
                 entity + " ID already exists: " + id) {}

NotFoundError::NotFoundError(const std::string& entity, const std::string& id)
    : GraphError(ErrorKind::NotFound, id,
                 entity + " not found: " + id) {}

EndpointNotFoundError::EndpointNotFoundError(const std::string& edge_id,
                                             const std::string& node_id,
                                             const std::string& role)
    : GraphError(ErrorKind::EndpointNotFound, node_id,
                 role + " node not found for edge " + edge_id + ": " + node_id),
      edge_id_(edge_id), role_(role) {}

ValidationError::ValidationError(const std::string& field, const std::string& message)
    : GraphError(ErrorKind::Validation, field, field + ": " + message) {}

StoreError::StoreError(const std::string& message, const std::string& subject)
    : GraphError(ErrorKind::Store, subject, "record store: " + message) {}

} // namespace kgraph
