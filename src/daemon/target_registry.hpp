#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"

namespace pagewatch {

struct RegistryLoadResult {
    std::vector<Target> targets;
    // Problems that were tolerated: malformed file, skipped entries.
    std::vector<std::string> warnings;
    // Set when the file exists but could not be read at all.
    std::optional<std::string> ioError;
};

/**
 * TargetRegistry owns sites.json, a JSON array of {"url": ..., "keywords": [...]}.
 *
 * Loading never throws: a missing file is an empty list, a malformed file is
 * an empty list plus a warning, and individual bad entries are skipped.
 * Mutations rewrite the whole file atomically.
 */
class TargetRegistry
{
public:
    explicit TargetRegistry(const QString &path);

    RegistryLoadResult load() const;

    // Creates the file as "[]" when it is missing or empty.
    bool ensureExists() const;

    // Adds a target, or replaces the keywords of an existing one with the
    // same url. Throws std::invalid_argument for a blank url and
    // std::runtime_error when the file cannot be read or written.
    void addTarget(const std::string &url, const std::vector<std::string> &keywords);

    // Returns false when no target had that url. Throws std::runtime_error
    // when the file cannot be read or written.
    bool removeTarget(const std::string &url);

    const QString &path() const;

    static RegistryLoadResult parse(const std::string &content);

private:
    std::vector<Target> loadForUpdate() const;
    void writeTargets(const std::vector<Target> &targets) const;

    QString m_path;
};

} // namespace pagewatch
