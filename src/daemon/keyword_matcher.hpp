#pragma once

#include <string>
#include <vector>

namespace pagewatch {

// Returns the keywords contained in text, ignoring case, in the order they
// were configured. Empty keywords never match.
std::vector<std::string> matchKeywords(const std::string &text,
                                       const std::vector<std::string> &keywords);

} // namespace pagewatch
