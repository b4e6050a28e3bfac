#include "memory_shared_map.hpp"

std::expected<std::optional<std::string>, RegistryError>
MemorySharedMap::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::optional<std::string>{};
    return std::optional<std::string>{it->second};
}

std::expected<void, RegistryError>
MemorySharedMap::insert(const std::string& key, const std::string& value) {
    std::lock_guard lock(mutex_);
    entries_[key] = value;
    return {};
}

std::expected<bool, RegistryError>
MemorySharedMap::try_insert(const std::string& key, const std::string& value) {
    std::lock_guard lock(mutex_);
    return entries_.emplace(key, value).second;
}

std::expected<std::optional<std::string>, RegistryError>
MemorySharedMap::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::optional<std::string>{};
    std::optional<std::string> prev = std::move(it->second);
    entries_.erase(it);
    return prev;
}

std::expected<void, RegistryError>
MemorySharedMap::remove_many(const std::vector<std::string>& keys) {
    std::lock_guard lock(mutex_);
    for (const auto& key : keys) entries_.erase(key);
    return {};
}

std::expected<std::vector<SharedMap::Entry>, RegistryError> MemorySharedMap::snapshot() {
    std::lock_guard lock(mutex_);
    return std::vector<Entry>(entries_.begin(), entries_.end());
}
