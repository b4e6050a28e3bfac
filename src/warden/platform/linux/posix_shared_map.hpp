#pragma once

#include "platform/shared_map.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <pthread.h>
#include <string>

// SharedMap over a POSIX shared memory object (shm_open + mmap).
//
// Region layout: RegionHeader, then packed records
//   [u32 key_len][u32 value_len][key bytes][value bytes]
// guarded by a robust, process-shared pthread mutex in the header.
class PosixSharedMap : public SharedMap {
public:
    static std::expected<std::unique_ptr<PosixSharedMap>, RegistryError>
        open(const std::string& name, size_t size);

    ~PosixSharedMap() override;

    PosixSharedMap(const PosixSharedMap&) = delete;
    PosixSharedMap& operator=(const PosixSharedMap&) = delete;

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

    const std::string& name() const { return name_; }
    size_t capacity() const;

    static std::string os_name(const std::string& name);

    // Values of RegionHeader::state. Anything above kStateReady is a claim
    // by the process initialising the header; a claim that stalls past the
    // init wait is taken over with the next value.
    static constexpr uint32_t kStateUninitialised = 0;
    static constexpr uint32_t kStateReady = 1;
    static constexpr uint32_t kStateFirstClaim = 2;

    struct RegionHeader {
        uint64_t magic;
        uint32_t version;
        uint32_t state;
        pthread_mutex_t lock;
        uint64_t capacity;  // bytes available for records
        uint64_t used;      // bytes occupied by records
        uint64_t count;
    };

private:

    class Lock {
    public:
        explicit Lock(pthread_mutex_t* m) : m_(m) {}
        ~Lock() { if (m_) pthread_mutex_unlock(m_); }
        Lock(Lock&& other) noexcept : m_(other.m_) { other.m_ = nullptr; }
        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;
        Lock& operator=(Lock&&) = delete;

    private:
        pthread_mutex_t* m_;
    };

    PosixSharedMap(std::string name, void* base, size_t length);

    static std::expected<void, RegistryError> initialise(RegionHeader* header, size_t length);
    // Returns once the header is ready, initialising it if nobody else is.
    static std::expected<void, RegistryError>
        ensure_ready(RegionHeader* header, size_t length, const std::string& path);

    std::expected<Lock, RegistryError> lock();

    // Byte offset of key's record in the data area, or npos.
    size_t find(const std::string& key) const;
    size_t record_size(size_t offset) const;
    void erase_at(size_t offset);
    void append(const std::string& key, const std::string& value);
    // Truncates the record area at the first record that does not parse.
    void repair();

    uint8_t* data() const;

    std::string name_;
    void* base_ = nullptr;
    size_t length_ = 0;
    RegionHeader* header_ = nullptr;
};
