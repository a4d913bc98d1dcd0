#pragma once

#include <string>

namespace kgraph {

/// ASCII lowercase copy. Bytes >= 0x80 are left untouched so UTF-8
/// sequences survive.
std::string toLower(const std::string& s);

/// Copy without leading/trailing ASCII whitespace.
std::string trim(const std::string& s);

/// Case-insensitive substring test; `needle_lower` must already be lowercase.
bool containsFolded(const std::string& haystack, const std::string& needle_lower);

bool startsWithFolded(const std::string& haystack, const std::string& needle_lower);

bool equalsFolded(const std::string& a, const std::string& b_lower);

} // namespace kgraph
