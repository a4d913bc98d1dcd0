#pragma once

#include <json/json.h>

#include <string>

namespace kgraph {

// ─── Property bags ─────────────────────────────────────────────
// Node and edge properties are a closed variant: string, integer,
// real, bool, null, or nested objects/arrays of those. Json::Value is
// exactly that variant; these helpers validate it at the boundary so
// everything inside the engine can assume a well-formed object.

using Properties = Json::Value;

/// Validate and normalize a property bag.
///   - null becomes an empty object
///   - anything else that is not an object is rejected
///   - non-finite reals are rejected (not serializable)
///   - unsigned integers that fit in Int64 are stored as signed, so a
///     bag compares equal to itself after a serialize/parse round trip
/// Throws ValidationError naming `subject`.
Properties checkedProperties(const Json::Value& props, const std::string& subject);

/// Shallow merge: keys in `patch` overwrite `target`; a null value
/// removes the key.
void mergeProperties(Properties& target, const Properties& patch);

/// Compact single-line JSON, UTF-8 kept as-is.
std::string stringifyProperties(const Properties& props);

/// Display form of a single value: strings raw, everything else compact JSON.
std::string stringifyValue(const Json::Value& value);

} // namespace kgraph
