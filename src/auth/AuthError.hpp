#pragma once

#include <QString>

namespace gsuite::auth {

enum class ErrorKind {
    None,

    // setup
    InvalidArgument,
    ConfigInvalid,
    PortUnavailable,
    StorageUnwritable,
    StorageCorrupt,

    // flow preconditions
    AlreadyAuthorized,
    FlowAlreadyInProgress,
    NoPendingFlow,

    // protocol
    StateMismatch,
    ProviderError,
    ExchangeFailed,
    NetworkError,

    Timeout,
    Cancelled,

    // credential
    UnknownAccount,
    NotAuthorized,
    ReauthorizationRequired,
};

struct AuthError {
    ErrorKind kind = ErrorKind::None;
    QString detail;

    bool IsSet() const { return kind != ErrorKind::None; }

    void Clear()
    {
        kind = ErrorKind::None;
        detail.clear();
    }

    void Set(ErrorKind k, const QString& d)
    {
        kind = k;
        detail = d;
    }
};

inline const char* ErrorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::InvalidArgument: return "invalid-argument";
    case ErrorKind::ConfigInvalid: return "config-invalid";
    case ErrorKind::PortUnavailable: return "port-unavailable";
    case ErrorKind::StorageUnwritable: return "storage-unwritable";
    case ErrorKind::StorageCorrupt: return "storage-corrupt";
    case ErrorKind::AlreadyAuthorized: return "already-authorized";
    case ErrorKind::FlowAlreadyInProgress: return "flow-already-in-progress";
    case ErrorKind::NoPendingFlow: return "no-pending-flow";
    case ErrorKind::StateMismatch: return "state-mismatch";
    case ErrorKind::ProviderError: return "provider-error";
    case ErrorKind::ExchangeFailed: return "exchange-failed";
    case ErrorKind::NetworkError: return "network-error";
    case ErrorKind::Timeout: return "timeout";
    case ErrorKind::Cancelled: return "cancelled";
    case ErrorKind::UnknownAccount: return "unknown-account";
    case ErrorKind::NotAuthorized: return "not-authorized";
    case ErrorKind::ReauthorizationRequired: return "reauthorization-required";
    }
    return "unknown";
}

inline QString Describe(const AuthError& err)
{
    if (err.detail.isEmpty()) {
        return QString::fromLatin1(ErrorKindName(err.kind));
    }
    return QString("%1: %2").arg(QString::fromLatin1(ErrorKindName(err.kind)), err.detail);
}

} // namespace gsuite::auth
