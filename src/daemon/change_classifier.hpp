#pragma once

#include <optional>
#include <string>

#include "common/models.hpp"

namespace pagewatch {

class ChangeClassifier
{
public:
    // Decides the status of a successfully fetched target and whether its
    // snapshot must be rewritten. Pure: touches neither store nor log.
    static Classification classify(const Target &target,
                                   const std::string &extractedText,
                                   const std::optional<Snapshot> &prior);
};

} // namespace pagewatch
