#pragma once

#include <QString>
#include <QStringList>
#include <QUrl>

#include "auth/AuthError.hpp"
#include "core/config/ManagerConfig.h"
#include "core/oauth/TokenClient.h"

namespace gsuite::core::oauth {

struct PkcePair {
    QString verifier;
    QString challenge;   // base64url(sha256(verifier))
};

struct OAuthResult {
    QString accessToken;
    QString refreshToken;      // empty when the provider issued none
    qint64 expiresAtUtc = 0;   // unix seconds
    QStringList scopes;        // granted scopes, or the requested ones if not echoed
};

// Wire side of the authorization-code grant. Stateless; the flow controller keeps the
// per-account state.
//
// Error mapping for both grants:
//   no HTTP answer, HTTP 5xx                 -> NetworkError
//   invalid_client / unauthorized_client     -> ConfigInvalid
//   any other HTTP 4xx (invalid_grant, ...)  -> ExchangeFailed
//   2xx without access_token                 -> ExchangeFailed
class OAuthBroker {
public:
    static QString RandomUrlSafe(int bytes);
    static PkcePair MakePkce();

    static QUrl BuildAuthorizationUrl(const gsuite::core::config::ManagerConfig& cfg,
                                      const QString& state,
                                      const QString& codeChallenge,
                                      const QString& loginHint);

    static bool ExchangeCode(TokenClient& client,
                             const gsuite::core::config::ManagerConfig& cfg,
                             const QString& code,
                             const QString& codeVerifier,
                             OAuthResult& out,
                             gsuite::auth::AuthError& outError);

    // out.refreshToken is the new refresh token if the provider rotated it, otherwise
    // the one passed in.
    static bool RefreshAccessToken(TokenClient& client,
                                   const gsuite::core::config::ManagerConfig& cfg,
                                   const QString& refreshToken,
                                   OAuthResult& out,
                                   gsuite::auth::AuthError& outError);
};

} // namespace gsuite::core::oauth
