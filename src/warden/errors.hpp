#pragma once

#include <string>

struct RegistryError {
    enum class Kind {
        SharedMemory,   // region open/create/map failed, or region too small
        MapOperation,   // map full, malformed region contents
        LockPoisoned,   // cross-process lock unrecoverable
        Serialization,  // TaskRecord (de)serialization
        TaskNotFound,
        DuplicatePid,
    };

    Kind kind;
    std::string message;
};

struct ProcessTreeError {
    enum class Kind { ProcessNotFound, Unsupported };

    Kind kind;
    std::string message;
};

struct SupervisorError {
    enum class Kind { Io, Registry, ProcessTree, CliNotFound, Other };

    Kind kind;
    std::string message;

    SupervisorError(Kind k, std::string msg) : kind(k), message(std::move(msg)) {}
    SupervisorError(const RegistryError& e);
    SupervisorError(const ProcessTreeError& e);
};

const char* to_string(RegistryError::Kind kind);
const char* to_string(ProcessTreeError::Kind kind);
const char* to_string(SupervisorError::Kind kind);

std::string to_string(const RegistryError& e);
std::string to_string(const ProcessTreeError& e);
std::string to_string(const SupervisorError& e);
