#include "daemon/target_registry.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

#include <QFile>
#include <QSaveFile>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

namespace pagewatch {

namespace {

std::string trimmed(const std::string &value)
{
    return QString::fromStdString(value).trimmed().toStdString();
}

std::vector<std::string> cleanKeywords(const std::vector<std::string> &keywords)
{
    std::vector<std::string> cleaned;
    for (const auto &keyword : keywords) {
        std::string value = trimmed(keyword);
        if (!value.empty()) {
            cleaned.push_back(std::move(value));
        }
    }
    return cleaned;
}

} // namespace

TargetRegistry::TargetRegistry(const QString &path)
    : m_path(path)
{
}

const QString &TargetRegistry::path() const
{
    return m_path;
}

RegistryLoadResult TargetRegistry::parse(const std::string &content)
{
    RegistryLoadResult result;

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error &ex) {
        result.warnings.push_back(std::string("sites config is not valid JSON: ") + ex.what());
        return result;
    }

    if (!document.is_array()) {
        result.warnings.push_back("sites config must be a JSON array");
        return result;
    }

    std::set<std::string> seen;
    std::size_t index = 0;
    for (const auto &entry : document) {
        const std::string position = "entry " + std::to_string(index++);
        if (!entry.is_object() || !entry.contains("url") || !entry.at("url").is_string()) {
            result.warnings.push_back(position + " has no url, skipped");
            continue;
        }

        Target target;
        target.url = trimmed(entry.at("url").get<std::string>());
        if (target.url.empty()) {
            result.warnings.push_back(position + " has an empty url, skipped");
            continue;
        }
        if (!seen.insert(target.url).second) {
            result.warnings.push_back(position + " duplicates " + target.url + ", skipped");
            continue;
        }

        if (entry.contains("keywords")) {
            const auto &keywords = entry.at("keywords");
            if (keywords.is_array()) {
                std::vector<std::string> raw;
                for (const auto &keyword : keywords) {
                    if (keyword.is_string()) {
                        raw.push_back(keyword.get<std::string>());
                    }
                }
                target.keywords = cleanKeywords(raw);
            } else if (!keywords.is_null()) {
                result.warnings.push_back(position + " keywords is not an array, ignored");
            }
        }

        result.targets.push_back(std::move(target));
    }
    return result;
}

RegistryLoadResult TargetRegistry::load() const
{
    QFile file(m_path);
    if (!file.exists()) {
        return {};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        RegistryLoadResult result;
        result.ioError = "cannot read " + m_path.toStdString() + ": "
            + file.errorString().toStdString();
        return result;
    }

    const QByteArray content = file.readAll();
    if (content.trimmed().isEmpty()) {
        return {};
    }
    return parse(content.toStdString());
}

bool TargetRegistry::ensureExists() const
{
    QFile file(m_path);
    if (file.exists() && file.size() > 0) {
        return true;
    }
    try {
        writeTargets({});
    } catch (const std::runtime_error &) {
        return false;
    }
    return true;
}

void TargetRegistry::addTarget(const std::string &url, const std::vector<std::string> &keywords)
{
    Target target;
    target.url = trimmed(url);
    if (target.url.empty()) {
        throw std::invalid_argument("url cannot be empty");
    }
    target.keywords = cleanKeywords(keywords);

    // A malformed file is replaced, matching how loading treats it as empty.
    std::vector<Target> targets = loadForUpdate();
    auto existing = std::find_if(targets.begin(), targets.end(), [&target](const Target &t) {
        return t.url == target.url;
    });
    if (existing != targets.end()) {
        existing->keywords = target.keywords;
    } else {
        targets.push_back(std::move(target));
    }
    writeTargets(targets);
}

bool TargetRegistry::removeTarget(const std::string &url)
{
    const std::string wanted = trimmed(url);
    std::vector<Target> targets = loadForUpdate();
    const auto before = targets.size();
    targets.erase(std::remove_if(targets.begin(), targets.end(),
                                 [&wanted](const Target &t) { return t.url == wanted; }),
                  targets.end());
    if (targets.size() == before) {
        return false;
    }
    writeTargets(targets);
    return true;
}

std::vector<Target> TargetRegistry::loadForUpdate() const
{
    RegistryLoadResult loaded = load();
    if (loaded.ioError.has_value()) {
        // Rewriting now would drop every entry we could not read.
        throw std::runtime_error(*loaded.ioError);
    }
    return std::move(loaded.targets);
}

void TargetRegistry::writeTargets(const std::vector<Target> &targets) const
{
    std::string payload;
    try {
        payload = nlohmann::json(targets).dump(2) + "\n";
    } catch (const nlohmann::json::type_error &ex) {
        throw std::runtime_error(std::string("cannot encode sites config: ") + ex.what());
    }

    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw std::runtime_error("cannot write " + m_path.toStdString() + ": "
                                 + file.errorString().toStdString());
    }
    file.write(payload.data(), static_cast<qint64>(payload.size()));
    if (!file.commit()) {
        throw std::runtime_error("cannot commit " + m_path.toStdString() + ": "
                                 + file.errorString().toStdString());
    }
}

} // namespace pagewatch
