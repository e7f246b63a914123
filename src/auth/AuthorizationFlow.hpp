#pragma once

#include <memory>
#include <mutex>
#include <optional>

#include <QDeadlineTimer>
#include <QHash>
#include <QString>

#include "auth/AuthError.hpp"
#include "core/config/ManagerConfig.h"
#include "core/oauth/CallbackListener.h"
#include "core/oauth/TokenClient.h"
#include "db/AccountRegistry.hpp"
#include "db/CredentialStore.hpp"

namespace gsuite::auth {

enum class FlowPhase {
    NotStarted,
    UrlIssued,
    AwaitingCallback,
    Exchanged,
    Complete,
    Failed,
};

const char* FlowPhaseName(FlowPhase phase);

// Drives the authorization-code grant for one email at a time per account:
//
//   Begin()            -> UrlIssued          (pending flow with fresh state + PKCE)
//   AwaitAndComplete() -> AwaitingCallback   (loopback listener running)
//   Complete()         -> Exchanged          (code traded for tokens)
//                      -> Complete           (credential + account written)
//   any failure        -> Failed             (pending flow discarded)
//
// Every Failed transition discards the pending flow; the caller restarts with Begin().
// The one exception is PortUnavailable from the listener, which leaves the flow in
// UrlIssued so the caller can free the port and await again with the same URL.
//
// Cancel() may be called from another thread while AwaitAndComplete() or Complete() is
// blocked. The blocked call then fails Cancelled and never touches a flow begun after the
// cancel. AwaitAndComplete() extends the pending flow's deadline to its own timeout.
class AuthorizationFlow {
public:
    AuthorizationFlow(const gsuite::core::config::ManagerConfig& cfg,
                      gsuite::db::AccountRegistry& registry,
                      gsuite::db::CredentialStore& store,
                      gsuite::core::oauth::TokenClient& tokens);

    AuthorizationFlow(const AuthorizationFlow&) = delete;
    AuthorizationFlow& operator=(const AuthorizationFlow&) = delete;

    bool Begin(const QString& email, bool forceReauth, QString& outUrl, AuthError& outError);

    bool Complete(const QString& email,
                  const QString& code,
                  const QString& state,
                  gsuite::db::Account& outAccount,
                  AuthError& outError);

    // timeoutSeconds <= 0 uses the configured callback timeout.
    bool AwaitAndComplete(const QString& email, int timeoutSeconds, gsuite::db::Account& outAccount, AuthError& outError);

    void Cancel(const QString& email);
    void CancelAll();

    bool HasPendingFlow(const QString& email) const;
    FlowPhase Phase(const QString& email) const;
    AuthError LastFailure(const QString& email) const;

private:
    struct PendingFlow {
        QString email;
        QString state;
        QString codeVerifier;
        QDeadlineTimer deadline;
        FlowPhase phase = FlowPhase::UrlIssued;
        bool busy = false;
        // Distinguishes a restarted flow from the one a caller started waiting on.
        quint64 generation = 0;
        std::shared_ptr<gsuite::core::oauth::CallbackListener> listener;
    };

    struct Terminal {
        FlowPhase phase = FlowPhase::NotStarted;
        AuthError error;
    };

    // listenedGeneration is set when AwaitAndComplete hands over the redirect it received.
    bool CompleteFlow(const QString& key,
                      const QString& code,
                      const QString& state,
                      std::optional<quint64> listenedGeneration,
                      gsuite::db::Account& outAccount,
                      AuthError& outError);
    bool HasValidCredential(const QString& key, bool& outValid, AuthError& outError);
    bool Persist(const QString& key,
                 const QString& accessToken,
                 const QString& refreshToken,
                 qint64 expiresAtUtc,
                 const QStringList& scopes,
                 gsuite::db::Account& outAccount,
                 AuthError& outError);

    // Must hold mu_.
    void FailLocked(const QString& key, const AuthError& error);

    const gsuite::core::config::ManagerConfig& cfg_;
    gsuite::db::AccountRegistry& registry_;
    gsuite::db::CredentialStore& store_;
    gsuite::core::oauth::TokenClient& tokens_;

    mutable std::mutex mu_;
    QHash<QString, PendingFlow> flows_;
    QHash<QString, Terminal> terminal_;
    quint64 nextGeneration_ = 0;
};

} // namespace gsuite::auth
