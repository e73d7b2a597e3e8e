#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "common/models.hpp"
#include "common/monitor_config.hpp"

namespace pagewatch {

// Raised by snapshot stores when a record cannot be read, parsed or written.
class StorageError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Lowercase hex MD5 of the url bytes. Only a storage key, never a secret.
std::string identityKey(const std::string &url);

/**
 * SnapshotStore keeps the last observed text of every target, one record per
 * identity key. Implementations must allow concurrent calls for different
 * keys and must never expose a half-written record: a failed save leaves the
 * previous snapshot readable.
 */
class SnapshotStore
{
public:
    virtual ~SnapshotStore() = default;

    virtual bool exists(const std::string &key) const = 0;
    // std::nullopt means never observed. Throws StorageError on a record
    // that exists but cannot be read.
    virtual std::optional<Snapshot> load(const std::string &key) const = 0;
    // Stamps the record with the current time and replaces any previous one.
    virtual void save(const std::string &key, const std::string &text) = 0;
};

// Builds the backend selected in the config. Throws StorageError if the
// backend cannot be opened.
std::unique_ptr<SnapshotStore> makeSnapshotStore(const MonitorConfig &config);

} // namespace pagewatch
