#pragma once

#include <optional>

#include <QString>
#include <QStringList>

#include "auth/AuthError.hpp"

namespace gsuite::db {

struct Credential {
    QString accessToken;
    QString refreshToken;     // empty = provider granted none
    qint64 expiresAtUtc = 0;  // unix seconds
    QStringList scopes;

    bool HasRefreshToken() const { return !refreshToken.isEmpty(); }
};

// One secret record per account: <dir>/.oauth2.<email>.json, owner-only.
// Saves replace the whole file atomically (temp file + rename), so readers see either
// the old record or the new one.
class CredentialStore {
public:
    CredentialStore() = default;

    // Creates the directory (0700) if missing.
    bool Open(const QString& directory, gsuite::auth::AuthError& outError);
    bool IsOpen() const;
    QString Directory() const;

    QString FilePathFor(const QString& email) const;

    bool Load(const QString& email, std::optional<Credential>& outCredential, gsuite::auth::AuthError& outError) const;
    bool Save(const QString& email, const Credential& credential, gsuite::auth::AuthError& outError);

    // outDeleted is false when there was no record.
    bool Delete(const QString& email, bool& outDeleted, gsuite::auth::AuthError& outError);

private:
    bool RequireOpen(const char* op, const QString& email, gsuite::auth::AuthError& outError) const;

    QString directory_;
};

} // namespace gsuite::db
