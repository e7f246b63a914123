#include "auth/CredentialAccessor.hpp"

#include <optional>

#include <QDateTime>
#include <QJsonObject>

#include "core/logging/AuditLog.h"
#include "core/oauth/OAuthBroker.h"
#include "db/Email.hpp"

namespace gsuite::auth {

using gsuite::core::logging::AuditLog;
using gsuite::core::oauth::OAuthBroker;
using gsuite::core::oauth::OAuthResult;
using gsuite::db::Account;
using gsuite::db::Credential;

namespace {

void AuditRefreshFail(const QString& key, const AuthError& err)
{
    AuditLog::Event("TOKEN_REFRESH_FAIL",
                    QJsonObject{{"email", AuditLog::RedactEmail(key)},
                                {"reason", QString::fromLatin1(ErrorKindName(err.kind))}});
}

} // namespace

CredentialAccessor::CredentialAccessor(const gsuite::core::config::ManagerConfig& cfg,
                                       gsuite::db::AccountRegistry& registry,
                                       gsuite::db::CredentialStore& store,
                                       gsuite::core::oauth::TokenClient& tokens)
    : cfg_(cfg)
    , registry_(registry)
    , store_(store)
    , tokens_(tokens)
{
}

void CredentialAccessor::DropCredential(const QString& key, AuthError& outError)
{
    bool deleted = false;
    AuthError deleteErr;
    if (!store_.Delete(key, deleted, deleteErr)) {
        outError.detail += QString("; stale credential not removed: %1").arg(Describe(deleteErr));
    }
}

bool CredentialAccessor::GetValidToken(const QString& email, QString& outAccessToken, AuthError& outError)
{
    outError.Clear();
    outAccessToken.clear();

    const QString key = gsuite::db::NormalizeEmail(email);
    if (!gsuite::db::LooksLikeEmail(key)) {
        outError.Set(ErrorKind::InvalidArgument, "valid email required");
        return false;
    }

    std::optional<Account> account;
    if (!registry_.Get(key, account, outError)) {
        return false;
    }
    if (!account) {
        outError.Set(ErrorKind::UnknownAccount, QString("%1 is not registered").arg(key));
        return false;
    }

    std::optional<Credential> cred;
    if (!store_.Load(key, cred, outError)) {
        return false;
    }
    if (!cred) {
        outError.Set(ErrorKind::NotAuthorized, QString("%1 has no stored credential").arg(key));
        return false;
    }

    const qint64 now = QDateTime::currentDateTimeUtc().toSecsSinceEpoch();
    if (cred->expiresAtUtc > now + cfg_.expirySafetyMarginSeconds) {
        outAccessToken = cred->accessToken;
        return true;
    }

    if (!cred->HasRefreshToken()) {
        outError.Set(ErrorKind::ReauthorizationRequired, "access token expired and no refresh token stored");
        DropCredential(key, outError);
        AuditRefreshFail(key, outError);
        return false;
    }

    OAuthResult refreshed;
    if (!OAuthBroker::RefreshAccessToken(tokens_, cfg_, cred->refreshToken, refreshed, outError)) {
        if (outError.kind == ErrorKind::ExchangeFailed) {
            // The grant is gone (revoked, expired, invalid_grant).
            outError.kind = ErrorKind::ReauthorizationRequired;
            DropCredential(key, outError);
        }
        AuditRefreshFail(key, outError);
        return false;
    }

    Credential updated = *cred;
    updated.accessToken = refreshed.accessToken;
    updated.refreshToken = refreshed.refreshToken;
    updated.expiresAtUtc = refreshed.expiresAtUtc;
    if (!refreshed.scopes.isEmpty()) {
        updated.scopes = refreshed.scopes;
    }

    if (!store_.Save(key, updated, outError)) {
        AuditRefreshFail(key, outError);
        return false;
    }

    AuditLog::Event("TOKEN_REFRESH_OK",
                    QJsonObject{{"email", AuditLog::RedactEmail(key)},
                                {"expires_at_utc", static_cast<double>(updated.expiresAtUtc)},
                                {"refresh_token_rotated", refreshed.refreshToken != cred->refreshToken}});

    outAccessToken = updated.accessToken;
    return true;
}

} // namespace gsuite::auth
