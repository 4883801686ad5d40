#pragma once
#include <stdexcept>
#include <string>

// Transient transport failure: connection refused, reset, timed out.
class NetworkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Chunk or whole-file digest mismatch.
class IntegrityError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed request or response.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RegistryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
    virtual const char* status() const = 0;
};

class UnknownPeerError : public RegistryError {
public:
    using RegistryError::RegistryError;
    const char* status() const override { return "UnknownPeerError"; }
};

class DuplicateAddressConflict : public RegistryError {
public:
    using RegistryError::RegistryError;
    const char* status() const override { return "DuplicateAddressConflict"; }
};

class PeerLimitReached : public RegistryError {
public:
    using RegistryError::RegistryError;
    const char* status() const override { return "PeerLimitReached"; }
};

// Retry budget or seeder set exhausted.
class ResourceExhaustedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A chunk is missing when the file is put back together.
class AssemblyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ErrorKind {
    None,
    Network,
    Integrity,
    Protocol,
    Registry,
    ResourceExhausted,
    Cancelled
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::Network: return "NetworkError";
        case ErrorKind::Integrity: return "IntegrityError";
        case ErrorKind::Protocol: return "ProtocolError";
        case ErrorKind::Registry: return "RegistryError";
        case ErrorKind::ResourceExhausted: return "ResourceExhaustedError";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}
