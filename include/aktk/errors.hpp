#pragma once

#include <stdexcept>
#include <string>

namespace aktk {

enum class ErrorKind {
    MalformedContainer,
    IntegrityMismatch,
    TransportFailure,
    PersistenceFailure,
    ProtocolCorruption
};

const char* ErrorKindName(ErrorKind kind) noexcept;

// Per-bundle failure. Never fatal for a batch.
class BundleError : public std::runtime_error {
public:
    BundleError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace aktk
