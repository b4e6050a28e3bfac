#include "platform/linux/posix_shared_map.hpp"

#include "log.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/mman.h>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace {

constexpr uint64_t kMagic = 0x3130474552574741ULL; // "AGWREG01"
constexpr uint32_t kVersion = 1;

constexpr size_t kRecordHeader = 2 * sizeof(uint32_t);
constexpr auto kInitWait = std::chrono::milliseconds(1000);

size_t align_up(size_t n, size_t a) {
    return (n + a - 1) & ~(a - 1);
}

RegistryError shm_error(const std::string& what, const std::string& name) {
    return {RegistryError::Kind::SharedMemory,
            std::format("{} ({}): {}", what, name, std::strerror(errno))};
}

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, sizeof(v));
    return v;
}

void write_u32(uint8_t* p, uint32_t v) {
    std::memcpy(p, &v, sizeof(v));
}

} // namespace

std::string PosixSharedMap::os_name(const std::string& name) {
    if (!name.empty() && name.front() == '/') return name;
    return "/" + name;
}

std::expected<std::unique_ptr<PosixSharedMap>, RegistryError>
PosixSharedMap::open(const std::string& name, size_t size) {
    auto path = os_name(name);
    size_t header_bytes = align_up(sizeof(RegionHeader), 8);

    // Checked before creating anything so a bad size leaves no object behind.
    if (size < header_bytes + kRecordHeader) {
        return std::unexpected(RegistryError{
            RegistryError::Kind::SharedMemory,
            std::format("shared memory region too small for task registry ({}, {} bytes)",
                        path, size)});
    }

    int fd = ::shm_open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) return std::unexpected(shm_error("shm_open failed", path));

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        auto err = shm_error("fstat failed", path);
        ::close(fd);
        return std::unexpected(err);
    }

    // A region created earlier keeps its size; a fresh one (size 0) is grown.
    size_t length = static_cast<size_t>(st.st_size);
    if (length == 0) {
        if (::ftruncate(fd, static_cast<off_t>(size)) != 0) {
            auto err = shm_error("ftruncate failed", path);
            ::close(fd);
            return std::unexpected(err);
        }
        length = size;
    }

    if (length < header_bytes + kRecordHeader) {
        ::close(fd);
        return std::unexpected(RegistryError{
            RegistryError::Kind::SharedMemory,
            std::format("shared memory region too small for task registry ({})", path)});
    }

    void* base = ::mmap(nullptr, length, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    ::close(fd);
    if (base == MAP_FAILED) return std::unexpected(shm_error("mmap failed", path));

    auto* header = static_cast<RegionHeader*>(base);
    if (auto res = ensure_ready(header, length, path); !res) {
        ::munmap(base, length);
        return std::unexpected(res.error());
    }

    if (header->magic != kMagic || header->version != kVersion) {
        ::munmap(base, length);
        return std::unexpected(RegistryError{
            RegistryError::Kind::SharedMemory,
            std::format("shared memory region {} has an unexpected layout", path)});
    }

    return std::unique_ptr<PosixSharedMap>(new PosixSharedMap(path, base, length));
}

PosixSharedMap::PosixSharedMap(std::string name, void* base, size_t length)
    : name_(std::move(name)), base_(base), length_(length),
      header_(static_cast<RegionHeader*>(base)) {}

PosixSharedMap::~PosixSharedMap() {
    if (base_) ::munmap(base_, length_);
}

std::expected<void, RegistryError>
PosixSharedMap::initialise(RegionHeader* header, size_t length) {
    pthread_mutexattr_t attr;
    pthread_mutexattr_init(&attr);
    pthread_mutexattr_setpshared(&attr, PTHREAD_PROCESS_SHARED);
#if defined(__linux__)
    pthread_mutexattr_setrobust(&attr, PTHREAD_MUTEX_ROBUST);
#endif

    int rc = 0;
    for (int attempt = 0; attempt < 3; ++attempt) {
        rc = pthread_mutex_init(&header->lock, &attr);
        if (rc == 0) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    pthread_mutexattr_destroy(&attr);

    if (rc != 0) {
        return std::unexpected(RegistryError{
            RegistryError::Kind::LockPoisoned,
            std::format("shared lock init failed after 3 attempts: {}", std::strerror(rc))});
    }

    header->magic = kMagic;
    header->version = kVersion;
    header->capacity = length - align_up(sizeof(RegionHeader), 8);
    header->used = 0;
    header->count = 0;
    return {};
}

std::expected<void, RegistryError>
PosixSharedMap::ensure_ready(RegionHeader* header, size_t length, const std::string& path) {
    using Clock = std::chrono::steady_clock;
    std::atomic_ref<uint32_t> state(header->state);

    uint32_t seen = state.load(std::memory_order_acquire);
    auto deadline = Clock::now() + kInitWait;

    while (seen != kStateReady) {
        bool stalled = Clock::now() > deadline;
        if (seen == kStateUninitialised || stalled) {
            uint32_t claim = seen == kStateUninitialised
                                 ? kStateFirstClaim
                                 : std::max(seen + 1, kStateFirstClaim);
            // On failure seen is refreshed with the current state.
            if (state.compare_exchange_strong(seen, claim)) {
                if (stalled) {
                    logging::warn(std::format(
                        "registry: initialisation of {} stalled, taking over", path));
                }
                if (auto res = initialise(header, length); !res) {
                    state.store(kStateUninitialised, std::memory_order_release);
                    return res;
                }
                state.store(kStateReady, std::memory_order_release);
                logging::debug(std::format("registry: initialised shared region {} ({} bytes)",
                                           path, length));
                return {};
            }
            deadline = Clock::now() + kInitWait;
            continue;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        uint32_t current = state.load(std::memory_order_acquire);
        if (current != seen) {
            // Another claim; give it a full wait of its own.
            seen = current;
            deadline = Clock::now() + kInitWait;
        }
    }
    return {};
}

size_t PosixSharedMap::capacity() const {
    return static_cast<size_t>(header_->capacity);
}

uint8_t* PosixSharedMap::data() const {
    return static_cast<uint8_t*>(base_) + align_up(sizeof(RegionHeader), 8);
}

std::expected<PosixSharedMap::Lock, RegistryError> PosixSharedMap::lock() {
    int rc = pthread_mutex_lock(&header_->lock);
#if defined(__linux__)
    if (rc == EOWNERDEAD) {
        // Previous holder died mid-operation; salvage what still parses.
        logging::warn(std::format("registry: previous lock owner of {} died, repairing region", name_));
        repair();
        pthread_mutex_consistent(&header_->lock);
        rc = 0;
    }
#endif
    if (rc != 0) {
        return std::unexpected(RegistryError{
            RegistryError::Kind::LockPoisoned,
            std::format("shared lock access failed: {}", std::strerror(rc))});
    }
    return Lock(&header_->lock);
}

size_t PosixSharedMap::record_size(size_t offset) const {
    const uint8_t* p = data() + offset;
    return kRecordHeader + read_u32(p) + read_u32(p + sizeof(uint32_t));
}

size_t PosixSharedMap::find(const std::string& key) const {
    size_t offset = 0;
    while (offset < header_->used) {
        const uint8_t* p = data() + offset;
        uint32_t klen = read_u32(p);
        if (klen == key.size() &&
            std::memcmp(p + kRecordHeader, key.data(), klen) == 0) {
            return offset;
        }
        offset += record_size(offset);
    }
    return std::string::npos;
}

void PosixSharedMap::erase_at(size_t offset) {
    size_t len = record_size(offset);
    uint8_t* p = data() + offset;
    std::memmove(p, p + len, header_->used - offset - len);
    header_->used -= len;
    header_->count -= 1;
}

void PosixSharedMap::append(const std::string& key, const std::string& value) {
    uint8_t* p = data() + header_->used;
    write_u32(p, static_cast<uint32_t>(key.size()));
    write_u32(p + sizeof(uint32_t), static_cast<uint32_t>(value.size()));
    std::memcpy(p + kRecordHeader, key.data(), key.size());
    std::memcpy(p + kRecordHeader + key.size(), value.data(), value.size());
    header_->used += kRecordHeader + key.size() + value.size();
    header_->count += 1;
}

void PosixSharedMap::repair() {
    size_t offset = 0;
    size_t count = 0;
    uint64_t used = std::min<uint64_t>(header_->used, header_->capacity);

    while (offset + kRecordHeader <= used) {
        size_t len = record_size(offset);
        if (offset + len > used) break;
        offset += len;
        ++count;
    }
    header_->used = offset;
    header_->count = count;
}

std::expected<std::optional<std::string>, RegistryError>
PosixSharedMap::get(const std::string& key) {
    auto guard = lock();
    if (!guard) return std::unexpected(guard.error());

    size_t offset = find(key);
    if (offset == std::string::npos) return std::optional<std::string>{};

    const uint8_t* p = data() + offset;
    uint32_t klen = read_u32(p);
    uint32_t vlen = read_u32(p + sizeof(uint32_t));
    return std::optional<std::string>{
        std::string(reinterpret_cast<const char*>(p + kRecordHeader + klen), vlen)};
}

std::expected<void, RegistryError>
PosixSharedMap::insert(const std::string& key, const std::string& value) {
    auto guard = lock();
    if (!guard) return std::unexpected(guard.error());

    size_t offset = find(key);
    size_t reclaimed = offset == std::string::npos ? 0 : record_size(offset);
    size_t needed = kRecordHeader + key.size() + value.size();

    if (header_->used - reclaimed + needed > header_->capacity) {
        return std::unexpected(RegistryError{
            RegistryError::Kind::MapOperation,
            std::format("registry region {} is full ({} bytes)", name_, header_->capacity)});
    }

    if (offset != std::string::npos) erase_at(offset);
    append(key, value);
    return {};
}

std::expected<bool, RegistryError>
PosixSharedMap::try_insert(const std::string& key, const std::string& value) {
    auto guard = lock();
    if (!guard) return std::unexpected(guard.error());

    if (find(key) != std::string::npos) return false;

    size_t needed = kRecordHeader + key.size() + value.size();
    if (header_->used + needed > header_->capacity) {
        return std::unexpected(RegistryError{
            RegistryError::Kind::MapOperation,
            std::format("registry region {} is full ({} bytes)", name_, header_->capacity)});
    }

    append(key, value);
    return true;
}

std::expected<std::optional<std::string>, RegistryError>
PosixSharedMap::remove(const std::string& key) {
    auto guard = lock();
    if (!guard) return std::unexpected(guard.error());

    size_t offset = find(key);
    if (offset == std::string::npos) return std::optional<std::string>{};

    const uint8_t* p = data() + offset;
    uint32_t klen = read_u32(p);
    uint32_t vlen = read_u32(p + sizeof(uint32_t));
    std::string prev(reinterpret_cast<const char*>(p + kRecordHeader + klen), vlen);
    erase_at(offset);
    return std::optional<std::string>{std::move(prev)};
}

std::expected<void, RegistryError>
PosixSharedMap::remove_many(const std::vector<std::string>& keys) {
    auto guard = lock();
    if (!guard) return std::unexpected(guard.error());

    for (const auto& key : keys) {
        size_t offset = find(key);
        if (offset != std::string::npos) erase_at(offset);
    }
    return {};
}

std::expected<std::vector<SharedMap::Entry>, RegistryError> PosixSharedMap::snapshot() {
    auto guard = lock();
    if (!guard) return std::unexpected(guard.error());

    std::vector<Entry> entries;
    entries.reserve(header_->count);

    size_t offset = 0;
    while (offset < header_->used) {
        const uint8_t* p = data() + offset;
        uint32_t klen = read_u32(p);
        uint32_t vlen = read_u32(p + sizeof(uint32_t));
        const char* k = reinterpret_cast<const char*>(p + kRecordHeader);
        entries.emplace_back(std::string(k, klen), std::string(k + klen, vlen));
        offset += kRecordHeader + klen + vlen;
    }
    return entries;
}

namespace platform {

std::expected<std::unique_ptr<SharedMap>, RegistryError>
open_or_create(const std::string& name, size_t size) {
    auto map = PosixSharedMap::open(name, size);
    if (!map) return std::unexpected(map.error());
    return std::unique_ptr<SharedMap>(std::move(*map));
}

std::expected<void, RegistryError> unlink_shared_map(const std::string& name) {
    auto path = PosixSharedMap::os_name(name);
    if (::shm_unlink(path.c_str()) != 0 && errno != ENOENT) {
        return std::unexpected(shm_error("shm_unlink failed", path));
    }
    return {};
}

} // namespace platform
