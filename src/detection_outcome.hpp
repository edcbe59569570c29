#pragma once
#include <string>
#include "detection_error.hpp"

namespace nmeascout
{

// ==================== Detection Outcome ====================
// Result of a single sniff attempt on one device.
struct DetectionOutcome {
    enum class Kind {
        Confirmed,
        Rejected,
        Excluded,
        TransportError,
        Canceled
    };

    Kind kind;
    int baud;             // Valid for Confirmed only
    std::string reason;   // Human-readable cause for every other kind
    ErrorKind errorKind;  // Taxonomy entry reported with attempt-failed

    DetectionOutcome() : kind(Kind::Rejected), baud(0), errorKind(ErrorKind::ProtocolMismatch) {}

    static DetectionOutcome confirmed(int baudRate)
    {
        DetectionOutcome o;
        o.kind = Kind::Confirmed;
        o.baud = baudRate;
        return o;
    }

    static DetectionOutcome rejected(const std::string &why)
    {
        DetectionOutcome o;
        o.kind = Kind::Rejected;
        o.reason = why;
        o.errorKind = ErrorKind::ProtocolMismatch;
        return o;
    }

    static DetectionOutcome excluded(const std::string &why)
    {
        DetectionOutcome o;
        o.kind = Kind::Excluded;
        o.reason = why;
        o.errorKind = ErrorKind::PolicyExcluded;
        return o;
    }

    static DetectionOutcome transportError(const std::string &cause,
                                           ErrorKind kind = ErrorKind::TransportError)
    {
        DetectionOutcome o;
        o.kind = Kind::TransportError;
        o.reason = cause;
        o.errorKind = kind;
        return o;
    }

    static DetectionOutcome canceled(const std::string &why)
    {
        DetectionOutcome o;
        o.kind = Kind::Canceled;
        o.reason = why;
        o.errorKind = ErrorKind::TransportError;
        return o;
    }

    bool isConfirmed() const { return kind == Kind::Confirmed; }

    // Rejected and TransportError count against the failure budget.
    bool countsAsFailure() const
    {
        return kind == Kind::Rejected || kind == Kind::TransportError;
    }
};

inline const char *outcomeKindName(DetectionOutcome::Kind kind)
{
    switch (kind)
    {
    case DetectionOutcome::Kind::Confirmed: return "confirmed";
    case DetectionOutcome::Kind::Rejected: return "rejected";
    case DetectionOutcome::Kind::Excluded: return "excluded";
    case DetectionOutcome::Kind::TransportError: return "transport-error";
    case DetectionOutcome::Kind::Canceled: return "canceled";
    }
    return "unknown";
}

} // namespace nmeascout
