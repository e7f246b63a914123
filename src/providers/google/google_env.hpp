#pragma once

#include <optional>

#include <QString>

namespace gsuite::providers::google::env {

inline constexpr const char* kPrefix = "GSUITE_";
inline constexpr const char* kGauthFile = "GSUITE_GAUTH_FILE";
inline constexpr const char* kAccountsDb = "GSUITE_ACCOUNTS_DB";
inline constexpr const char* kCredentialsDir = "GSUITE_CREDENTIALS_DIR";
inline constexpr const char* kAuditLog = "GSUITE_AUDIT_LOG";
inline constexpr const char* kCallbackTimeout = "GSUITE_CALLBACK_TIMEOUT";

inline constexpr const char* kDefaultGauthFile = "./.gauth.json";
inline constexpr const char* kDefaultAccountsDb = "./.accounts.db";
inline constexpr const char* kDefaultCredentialsDir = ".";

inline constexpr const char* LOG_PREFIX = "[GSUITE]";

inline std::optional<QString> ReadOptional(const char* key)
{
    const QString value = QString::fromUtf8(qgetenv(key)).trimmed();
    if (value.isEmpty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace gsuite::providers::google::env
