#include "aktk/errors.hpp"

namespace aktk {

const char* ErrorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MalformedContainer:
            return "malformed container";
        case ErrorKind::IntegrityMismatch:
            return "integrity mismatch";
        case ErrorKind::TransportFailure:
            return "transport failure";
        case ErrorKind::PersistenceFailure:
            return "persistence failure";
        case ErrorKind::ProtocolCorruption:
            return "protocol corruption";
    }
    return "unknown";
}

}  // namespace aktk
