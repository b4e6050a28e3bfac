#include "errors.hpp"

#include <format>

SupervisorError::SupervisorError(const RegistryError& e)
    : kind(Kind::Registry), message(to_string(e)) {}

SupervisorError::SupervisorError(const ProcessTreeError& e)
    : kind(Kind::ProcessTree), message(to_string(e)) {}

const char* to_string(RegistryError::Kind kind) {
    switch (kind) {
        case RegistryError::Kind::SharedMemory: return "shared memory error";
        case RegistryError::Kind::MapOperation: return "map operation failed";
        case RegistryError::Kind::LockPoisoned: return "registry lock poisoned";
        case RegistryError::Kind::Serialization: return "task record serialization error";
        case RegistryError::Kind::TaskNotFound: return "task not found";
        case RegistryError::Kind::DuplicatePid: return "pid already registered";
    }
    return "registry error";
}

const char* to_string(ProcessTreeError::Kind kind) {
    switch (kind) {
        case ProcessTreeError::Kind::ProcessNotFound: return "process not found";
        case ProcessTreeError::Kind::Unsupported: return "unsupported platform";
    }
    return "process tree error";
}

const char* to_string(SupervisorError::Kind kind) {
    switch (kind) {
        case SupervisorError::Kind::Io: return "I/O error";
        case SupervisorError::Kind::Registry: return "registry error";
        case SupervisorError::Kind::ProcessTree: return "process tree error";
        case SupervisorError::Kind::CliNotFound: return "CLI executable not found";
        case SupervisorError::Kind::Other: return "error";
    }
    return "error";
}

std::string to_string(const RegistryError& e) {
    if (e.message.empty()) return to_string(e.kind);
    return std::format("{}: {}", to_string(e.kind), e.message);
}

std::string to_string(const ProcessTreeError& e) {
    if (e.message.empty()) return to_string(e.kind);
    return std::format("{}: {}", to_string(e.kind), e.message);
}

std::string to_string(const SupervisorError& e) {
    // Registry and process tree errors already carry their own prefix.
    if (e.kind == SupervisorError::Kind::Other ||
        e.kind == SupervisorError::Kind::Registry ||
        e.kind == SupervisorError::Kind::ProcessTree) {
        return e.message;
    }
    return std::format("{}: {}", to_string(e.kind), e.message);
}
