#pragma once

#include <QString>

#include "auth/AuthError.hpp"
#include "core/config/ManagerConfig.h"
#include "core/oauth/TokenClient.h"
#include "db/AccountRegistry.hpp"
#include "db/CredentialStore.hpp"

namespace gsuite::auth {

// Hands out usable access tokens, refreshing on demand.
//
//   UnknownAccount            account not registered (any credential on disk is ignored)
//   NotAuthorized             registered but no credential
//   ReauthorizationRequired   expired without refresh token, or refresh rejected (4xx);
//                             the credential is deleted, the account kept
//   NetworkError              provider unreachable or 5xx; the credential is kept
//
// Never starts a browser flow.
class CredentialAccessor {
public:
    CredentialAccessor(const gsuite::core::config::ManagerConfig& cfg,
                       gsuite::db::AccountRegistry& registry,
                       gsuite::db::CredentialStore& store,
                       gsuite::core::oauth::TokenClient& tokens);

    bool GetValidToken(const QString& email, QString& outAccessToken, AuthError& outError);

private:
    // Deletes the stored credential; a failed delete is appended to outError.detail.
    void DropCredential(const QString& key, AuthError& outError);

    const gsuite::core::config::ManagerConfig& cfg_;
    gsuite::db::AccountRegistry& registry_;
    gsuite::db::CredentialStore& store_;
    gsuite::core::oauth::TokenClient& tokens_;
};

} // namespace gsuite::auth
