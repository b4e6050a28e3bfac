#pragma once

#include "errors.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// String-to-string map that may be shared with other OS processes.
// Every call is atomic with respect to other users of the same map.
class SharedMap {
public:
    using Entry = std::pair<std::string, std::string>;

    virtual ~SharedMap() = default;

    virtual std::expected<std::optional<std::string>, RegistryError>
        get(const std::string& key) = 0;

    // Inserts or overwrites.
    virtual std::expected<void, RegistryError>
        insert(const std::string& key, const std::string& value) = 0;

    // Inserts only if key is absent; returns false if it was present.
    virtual std::expected<bool, RegistryError>
        try_insert(const std::string& key, const std::string& value) = 0;

    // Returns the previous value, if any.
    virtual std::expected<std::optional<std::string>, RegistryError>
        remove(const std::string& key) = 0;

    virtual std::expected<void, RegistryError>
        remove_many(const std::vector<std::string>& keys) = 0;

    virtual std::expected<std::vector<Entry>, RegistryError> snapshot() = 0;
};

namespace platform {

// Maps the named region, creating and initialising it if nobody has yet.
// The region outlives the process that created it.
std::expected<std::unique_ptr<SharedMap>, RegistryError>
    open_or_create(const std::string& name, size_t size);

// Removes the region name; processes that still map it keep their view.
std::expected<void, RegistryError> unlink_shared_map(const std::string& name);

} // namespace platform
