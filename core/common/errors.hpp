#pragma once

#include <stdexcept>
#include <string>

namespace kgraph {

// ─── Error kinds ───────────────────────────────────────────────
// Every failure surfaced by the engine is a GraphError carrying its
// kind and the offending id or field, so callers can render a precise
// message or map it onto a transport status.

enum class ErrorKind {
    DuplicateId,
    NotFound,
    EndpointNotFound,
    Validation,
    Store,
};

const char* errorKindName(ErrorKind kind);

class GraphError : public std::runtime_error {
public:
    GraphError(ErrorKind kind, std::string subject, const std::string& message);

    ErrorKind kind() const { return kind_; }

    /// The id or field the error is about.
    const std::string& subject() const { return subject_; }

private:
    ErrorKind kind_;
    std::string subject_;
};

/// Create with an id that is already live in the collection.
class DuplicateIdError : public GraphError {
public:
    DuplicateIdError(const std::string& entity, const std::string& id);
};

/// Referenced node, edge or collection is absent.
class NotFoundError : public GraphError {
public:
    NotFoundError(const std::string& entity, const std::string& id);
};

/// An edge names a node that does not exist in its collection.
/// subject() is the missing node id.
class EndpointNotFoundError : public GraphError {
public:
    EndpointNotFoundError(const std::string& edge_id, const std::string& node_id,
                          const std::string& role);

    const std::string& edgeId() const { return edge_id_; }
    const std::string& role() const { return role_; }

private:
    std::string edge_id_;
    std::string role_;
};

class ValidationError : public GraphError {
public:
    ValidationError(const std::string& field, const std::string& message);
};

/// Record store failure. Retryable by the caller.
class StoreError : public GraphError {
public:
    explicit StoreError(const std::string& message, const std::string& subject = "");
};

} // namespace kgraph
