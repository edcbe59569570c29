#pragma once
#include <stdexcept>
#include <string>

namespace nmeascout
{

// ==================== Error Taxonomy ====================
enum class ErrorKind {
    PolicyExcluded,        // Device or category disabled, or failure budget spent
    TransportUnavailable,  // Channel missing or misconfigured
    PermissionDenied,      // Pairing/security rejection
    ProtocolMismatch,      // Opened fine, no sentences at any tested rate
    TransportError         // Unexpected I/O failure mid-sniff
};

inline const char *errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::PolicyExcluded: return "policy-excluded";
    case ErrorKind::TransportUnavailable: return "transport-unavailable";
    case ErrorKind::PermissionDenied: return "permission-denied";
    case ErrorKind::ProtocolMismatch: return "protocol-mismatch";
    case ErrorKind::TransportError: return "transport-error";
    }
    return "unknown";
}

// Raised by channels and devices; carried by attempt-failed notifications.
class DeviceError : public std::runtime_error {
public:
    DeviceError(ErrorKind kind, const std::string &identity, const std::string &message)
        : std::runtime_error(message), kind_(kind), identity_(identity) {}

    ErrorKind kind() const { return kind_; }
    const std::string &identity() const { return identity_; }

private:
    ErrorKind kind_;
    std::string identity_;
};

} // namespace nmeascout
