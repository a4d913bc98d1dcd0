#include "common/text.hpp"

#include <algorithm>
#include <cctype>

namespace kgraph {

std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return out;
}

std::string trim(const std::string& s) {
    auto is_space = [](unsigned char c) { return c < 0x80 && std::isspace(c); };
    size_t begin = 0;
    while (begin < s.size() && is_space(s[begin])) begin++;
    size_t end = s.size();
    while (end > begin && is_space(s[end - 1])) end--;
    return s.substr(begin, end - begin);
}

bool containsFolded(const std::string& haystack, const std::string& needle_lower) {
    if (needle_lower.empty()) return true;
    return toLower(haystack).find(needle_lower) != std::string::npos;
}

bool startsWithFolded(const std::string& haystack, const std::string& needle_lower) {
    if (needle_lower.size() > haystack.size()) return false;
    return toLower(haystack.substr(0, needle_lower.size())) == needle_lower;
}

bool equalsFolded(const std::string& a, const std::string& b_lower) {
    return a.size() == b_lower.size() && toLower(a) == b_lower;
}

} // namespace kgraph
