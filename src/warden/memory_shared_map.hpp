#pragma once

#include "platform/shared_map.hpp"

#include <map>
#include <mutex>

// In-process SharedMap. Backs registries that never leave the process
// (and the registry tests).
class MemorySharedMap : public SharedMap {
public:
    MemorySharedMap() = default;

    MemorySharedMap(const MemorySharedMap&) = delete;
    MemorySharedMap& operator=(const MemorySharedMap&) = delete;

    std::expected<std::optional<std::string>, RegistryError>
        get(const std::string& key) override;
    std::expected<void, RegistryError>
        insert(const std::string& key, const std::string& value) override;
    std::expected<bool, RegistryError>
        try_insert(const std::string& key, const std::string& value) override;
    std::expected<std::optional<std::string>, RegistryError>
        remove(const std::string& key) override;
    std::expected<void, RegistryError>
        remove_many(const std::vector<std::string>& keys) override;
    std::expected<std::vector<Entry>, RegistryError> snapshot() override;

private:
    std::mutex mutex_;
    std::map<std::string, std::string> entries_;
};
