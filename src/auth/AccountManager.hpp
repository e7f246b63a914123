#pragma once

#include <memory>
#include <optional>

#include <QString>
#include <QVector>

#include "auth/AuthError.hpp"
#include "auth/AuthorizationFlow.hpp"
#include "auth/CredentialAccessor.hpp"
#include "core/config/ManagerConfig.h"
#include "core/oauth/TokenClient.h"
#include "db/AccountRegistry.hpp"
#include "db/CredentialStore.hpp"

namespace gsuite::auth {

// Consumer-facing entry point. Owns the registry, the credential store, the flow
// controller and the accessor; call Open() once before anything else.
class AccountManager {
public:
    // Talks to the configured token endpoint over HTTP.
    explicit AccountManager(gsuite::core::config::ManagerConfig cfg);

    // Uses the given token client; it must outlive the manager.
    AccountManager(gsuite::core::config::ManagerConfig cfg, gsuite::core::oauth::TokenClient& tokens);

    ~AccountManager();

    AccountManager(const AccountManager&) = delete;
    AccountManager& operator=(const AccountManager&) = delete;

    // Validates the config, starts the audit log (if a path is set) and opens both stores.
    bool Open(AuthError& outError);
    bool IsOpen() const;

    const gsuite::core::config::ManagerConfig& Config() const { return cfg_; }

    bool ListAccounts(QVector<gsuite::db::Account>& outAccounts, AuthError& outError);
    bool GetAccount(const QString& email, std::optional<gsuite::db::Account>& outAccount, AuthError& outError);

    // Registry entry first, then the credential. outRemoved is false if the account
    // was not registered (a leftover credential is still deleted).
    bool RemoveAccount(const QString& email, bool& outRemoved, AuthError& outError);

    // UnknownAccount if not registered.
    bool UpdateAccountInfo(const QString& email, const QString& accountType, const QString& extraInfo, AuthError& outError);

    // Registered and holding a credential (expired or not).
    bool IsAccountAuthorized(const QString& email, bool& outAuthorized, AuthError& outError);

    bool BeginAuthorization(const QString& email, bool forceReauth, QString& outUrl, AuthError& outError);
    bool CompleteAuthorization(const QString& email,
                               const QString& code,
                               const QString& state,
                               gsuite::db::Account& outAccount,
                               AuthError& outError);
    bool AwaitAndComplete(const QString& email, int timeoutSeconds, gsuite::db::Account& outAccount, AuthError& outError);
    void CancelAuthorization(const QString& email);
    FlowPhase AuthorizationPhase(const QString& email) const;

    bool GetValidToken(const QString& email, QString& outAccessToken, AuthError& outError);

private:
    bool RequireOpen(AuthError& outError) const;

    gsuite::core::config::ManagerConfig cfg_;
    gsuite::db::AccountRegistry registry_;
    gsuite::db::CredentialStore store_;

    std::unique_ptr<gsuite::core::oauth::TokenClient> ownedTokens_;
    gsuite::core::oauth::TokenClient* tokens_ = nullptr;

    std::unique_ptr<AuthorizationFlow> flow_;
    std::unique_ptr<CredentialAccessor> accessor_;
};

} // namespace gsuite::auth
