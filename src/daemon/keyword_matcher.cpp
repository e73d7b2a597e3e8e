#include "daemon/keyword_matcher.hpp"

#include <QString>

namespace pagewatch {

std::vector<std::string> matchKeywords(const std::string &text,
                                       const std::vector<std::string> &keywords)
{
    std::vector<std::string> matched;
    if (keywords.empty()) {
        return matched;
    }

    // Qt folds case with full Unicode tables, so "ÄRGER" finds "ärger".
    const QString haystack = QString::fromStdString(text);
    for (const auto &keyword : keywords) {
        const QString needle = QString::fromStdString(keyword);
        if (needle.isEmpty()) {
            continue;
        }
        if (haystack.contains(needle, Qt::CaseInsensitive)) {
            matched.push_back(keyword);
        }
    }
    return matched;
}

} // namespace pagewatch
