#include "auth/AuthorizationFlow.hpp"

#include <optional>

#include <QDateTime>
#include <QJsonObject>

#include "core/logging/AuditLog.h"
#include "core/oauth/OAuthBroker.h"
#include "db/Email.hpp"

namespace gsuite::auth {

using gsuite::core::logging::AuditLog;
using gsuite::core::oauth::CallbackListener;
using gsuite::core::oauth::CallbackResult;
using gsuite::core::oauth::OAuthBroker;
using gsuite::core::oauth::OAuthResult;
using gsuite::db::Account;
using gsuite::db::Credential;
using gsuite::db::NormalizeEmail;

namespace {

constexpr int kStateBytes = 24;

bool ConstantTimeEquals(const QString& a, const QString& b)
{
    const QByteArray x = a.toUtf8();
    const QByteArray y = b.toUtf8();
    if (x.size() != y.size()) {
        return false;
    }
    unsigned char diff = 0;
    for (int i = 0; i < x.size(); ++i) {
        diff |= static_cast<unsigned char>(x[i] ^ y[i]);
    }
    return diff == 0;
}

qint64 NowUtcSeconds()
{
    return QDateTime::currentDateTimeUtc().toSecsSinceEpoch();
}

void AuditFailure(const QString& key, const AuthError& err)
{
    AuditLog::Event("OAUTH_EXCHANGE_FAIL",
                    QJsonObject{{"email", AuditLog::RedactEmail(key)},
                                {"reason", QString::fromLatin1(ErrorKindName(err.kind))}});
}

} // namespace

const char* FlowPhaseName(FlowPhase phase)
{
    switch (phase) {
    case FlowPhase::NotStarted: return "not-started";
    case FlowPhase::UrlIssued: return "url-issued";
    case FlowPhase::AwaitingCallback: return "awaiting-callback";
    case FlowPhase::Exchanged: return "exchanged";
    case FlowPhase::Complete: return "complete";
    case FlowPhase::Failed: return "failed";
    }
    return "unknown";
}

AuthorizationFlow::AuthorizationFlow(const gsuite::core::config::ManagerConfig& cfg,
                                     gsuite::db::AccountRegistry& registry,
                                     gsuite::db::CredentialStore& store,
                                     gsuite::core::oauth::TokenClient& tokens)
    : cfg_(cfg)
    , registry_(registry)
    , store_(store)
    , tokens_(tokens)
{
}

bool AuthorizationFlow::HasValidCredential(const QString& key, bool& outValid, AuthError& outError)
{
    outValid = false;

    std::optional<Account> account;
    if (!registry_.Get(key, account, outError)) {
        return false;
    }
    if (!account) {
        // An orphaned credential never counts.
        return true;
    }

    std::optional<Credential> cred;
    if (!store_.Load(key, cred, outError)) {
        return false;
    }
    outValid = cred && cred->expiresAtUtc > NowUtcSeconds() + cfg_.expirySafetyMarginSeconds;
    return true;
}

bool AuthorizationFlow::Begin(const QString& email, bool forceReauth, QString& outUrl, AuthError& outError)
{
    outError.Clear();
    outUrl.clear();

    const QString key = NormalizeEmail(email);
    if (!gsuite::db::LooksLikeEmail(key)) {
        outError.Set(ErrorKind::InvalidArgument, "valid email required");
        return false;
    }

    if (!forceReauth) {
        bool valid = false;
        if (!HasValidCredential(key, valid, outError)) {
            return false;
        }
        if (valid) {
            outError.Set(ErrorKind::AlreadyAuthorized, QString("%1 already holds a valid credential").arg(key));
            return false;
        }
    }

    std::lock_guard<std::mutex> lk(mu_);

    auto it = flows_.find(key);
    if (it != flows_.end()) {
        if (!it->deadline.hasExpired() || it->busy) {
            outError.Set(ErrorKind::FlowAlreadyInProgress, QString("authorization for %1 already pending").arg(key));
            return false;
        }
        // Abandoned attempt past its deadline.
        flows_.erase(it);
    }

    const gsuite::core::oauth::PkcePair pkce = OAuthBroker::MakePkce();

    PendingFlow flow;
    flow.email = key;
    flow.state = OAuthBroker::RandomUrlSafe(kStateBytes);
    flow.codeVerifier = pkce.verifier;
    flow.deadline = QDeadlineTimer(static_cast<qint64>(cfg_.callbackTimeoutSeconds) * 1000);
    flow.phase = FlowPhase::UrlIssued;
    flow.generation = ++nextGeneration_;

    outUrl = OAuthBroker::BuildAuthorizationUrl(cfg_, flow.state, pkce.challenge, key).toString(QUrl::FullyEncoded);

    flows_.insert(key, flow);
    terminal_.remove(key);

    AuditLog::Event("OAUTH_BEGIN",
                    QJsonObject{{"email", AuditLog::RedactEmail(key)}, {"force", forceReauth}});
    return true;
}

bool AuthorizationFlow::Complete(const QString& email,
                                 const QString& code,
                                 const QString& state,
                                 Account& outAccount,
                                 AuthError& outError)
{
    return CompleteFlow(NormalizeEmail(email), code, state, std::nullopt, outAccount, outError);
}

bool AuthorizationFlow::CompleteFlow(const QString& key,
                                     const QString& code,
                                     const QString& state,
                                     std::optional<quint64> listenedGeneration,
                                     Account& outAccount,
                                     AuthError& outError)
{
    outError.Clear();
    outAccount = Account{};

    QString codeVerifier;
    quint64 generation = 0;

    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = flows_.find(key);
        if (listenedGeneration && (it == flows_.end() || it->generation != *listenedGeneration)) {
            outError.Set(ErrorKind::Cancelled, "authorization cancelled");
            return false;
        }
        if (it == flows_.end()) {
            outError.Set(ErrorKind::NoPendingFlow, QString("no authorization pending for %1").arg(key));
            return false;
        }
        // A flow handed over by AwaitAndComplete is still marked busy and its deadline
        // was already enforced by the listener.
        if (!listenedGeneration) {
            if (it->busy) {
                outError.Set(ErrorKind::FlowAlreadyInProgress, "callback or exchange already running");
                return false;
            }
            if (it->deadline.hasExpired()) {
                outError.Set(ErrorKind::Timeout, "pending authorization expired");
                FailLocked(key, outError);
                return false;
            }
        }
        if (state.isEmpty() || !ConstantTimeEquals(state, it->state)) {
            outError.Set(ErrorKind::StateMismatch, "callback state does not match the issued state");
            FailLocked(key, outError);
            return false;
        }
        it->busy = true;
        codeVerifier = it->codeVerifier;
        generation = it->generation;
    }

    OAuthResult tokens;
    AuthError exchangeErr;
    const bool exchanged = OAuthBroker::ExchangeCode(tokens_, cfg_, code, codeVerifier, tokens, exchangeErr);

    // Held through Persist so a concurrent Cancel either lands before the tokens are
    // written or finds no flow left to cancel.
    std::lock_guard<std::mutex> lk(mu_);
    auto it = flows_.find(key);
    if (it == flows_.end() || it->generation != generation) {
        // Cancelled (and possibly restarted) while the exchange was in flight: drop the
        // tokens unpersisted and leave any newer flow alone.
        outError.Set(ErrorKind::Cancelled, "authorization cancelled");
        return false;
    }
    if (!exchanged) {
        // Codes are single-use, so a rejected exchange ends the attempt.
        outError = exchangeErr;
        FailLocked(key, outError);
        return false;
    }
    it->phase = FlowPhase::Exchanged;

    AuthError persistErr;
    if (!Persist(key, tokens.accessToken, tokens.refreshToken, tokens.expiresAtUtc, tokens.scopes, outAccount, persistErr)) {
        outError = persistErr;
        FailLocked(key, outError);
        return false;
    }

    flows_.erase(it);
    Terminal done;
    done.phase = FlowPhase::Complete;
    terminal_.insert(key, done);

    AuditLog::Event("OAUTH_EXCHANGE_OK",
                    QJsonObject{{"email", AuditLog::RedactEmail(key)},
                                {"refresh_token_present", !tokens.refreshToken.isEmpty()},
                                {"scopes", tokens.scopes.size()}});
    return true;
}

bool AuthorizationFlow::Persist(const QString& key,
                                const QString& accessToken,
                                const QString& refreshToken,
                                qint64 expiresAtUtc,
                                const QStringList& scopes,
                                Account& outAccount,
                                AuthError& outError)
{
    std::optional<Account> existing;
    if (!registry_.Get(key, existing, outError)) {
        return false;
    }
    std::optional<Credential> previous;
    if (!store_.Load(key, previous, outError)) {
        // An unreadable old record is replaced below.
        previous.reset();
    }

    Credential cred;
    cred.accessToken = accessToken;
    cred.refreshToken = refreshToken;
    cred.expiresAtUtc = expiresAtUtc;
    cred.scopes = scopes;
    // Re-consent without a new refresh token keeps the one already granted.
    if (cred.refreshToken.isEmpty() && previous && previous->HasRefreshToken()) {
        cred.refreshToken = previous->refreshToken;
    }

    if (!store_.Save(key, cred, outError)) {
        return false;
    }

    Account account = existing.value_or(Account{});
    account.email = key;
    if (!registry_.Upsert(account, outError)) {
        // Undo the credential so nothing is left without an account.
        AuthError undoErr;
        bool undone = false;
        if (previous) {
            undone = store_.Save(key, *previous, undoErr);
        } else {
            bool deleted = false;
            undone = store_.Delete(key, deleted, undoErr);
        }
        if (!undone) {
            outError.detail += QString("; rollback failed: %1").arg(Describe(undoErr));
        }
        return false;
    }

    std::optional<Account> stored;
    if (!registry_.Get(key, stored, outError)) {
        return false;
    }
    outAccount = stored.value_or(account);
    return true;
}

bool AuthorizationFlow::AwaitAndComplete(const QString& email, int timeoutSeconds, Account& outAccount, AuthError& outError)
{
    outError.Clear();
    outAccount = Account{};

    const QString key = NormalizeEmail(email);
    const int seconds = timeoutSeconds > 0 ? timeoutSeconds : cfg_.callbackTimeoutSeconds;
    const QDeadlineTimer deadline(static_cast<qint64>(seconds) * 1000);
    std::shared_ptr<CallbackListener> listener;
    quint64 generation = 0;

    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = flows_.find(key);
        if (it == flows_.end()) {
            outError.Set(ErrorKind::NoPendingFlow, QString("no authorization pending for %1").arg(key));
            return false;
        }
        if (it->busy) {
            outError.Set(ErrorKind::FlowAlreadyInProgress, "callback or exchange already running");
            return false;
        }
        listener = std::make_shared<CallbackListener>();
        it->listener = listener;
        it->busy = true;
        it->phase = FlowPhase::AwaitingCallback;
        // The caller's wait replaces the deadline set by Begin.
        it->deadline = deadline;
        generation = it->generation;
    }

    CallbackResult redirect;
    AuthError listenErr;
    const bool received = listener->AwaitRedirect(static_cast<quint16>(gsuite::core::config::CallbackPort(cfg_)),
                                                  gsuite::core::config::CallbackPath(cfg_),
                                                  deadline,
                                                  redirect,
                                                  listenErr);

    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = flows_.find(key);
        if (it == flows_.end() || it->generation != generation) {
            outError.Set(ErrorKind::Cancelled, "authorization cancelled");
            return false;
        }
        it->listener.reset();

        if (!received) {
            it->busy = false;
            outError = listenErr;
            if (listenErr.kind == ErrorKind::PortUnavailable) {
                it->phase = FlowPhase::UrlIssued;
            } else {
                FailLocked(key, outError);
            }
            return false;
        }
    }

    return CompleteFlow(key, redirect.code, redirect.state, generation, outAccount, outError);
}

void AuthorizationFlow::Cancel(const QString& email)
{
    const QString key = NormalizeEmail(email);

    std::lock_guard<std::mutex> lk(mu_);
    auto it = flows_.find(key);
    if (it == flows_.end()) {
        return;
    }
    if (it->listener) {
        it->listener->Cancel();
    }
    flows_.erase(it);
    terminal_.remove(key);

    AuditLog::Event("OAUTH_CANCEL", QJsonObject{{"email", AuditLog::RedactEmail(key)}});
}

void AuthorizationFlow::CancelAll()
{
    std::lock_guard<std::mutex> lk(mu_);
    for (const PendingFlow& flow : flows_) {
        if (flow.listener) {
            flow.listener->Cancel();
        }
        AuditLog::Event("OAUTH_CANCEL", QJsonObject{{"email", AuditLog::RedactEmail(flow.email)}});
    }
    flows_.clear();
}

bool AuthorizationFlow::HasPendingFlow(const QString& email) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return flows_.contains(NormalizeEmail(email));
}

FlowPhase AuthorizationFlow::Phase(const QString& email) const
{
    const QString key = NormalizeEmail(email);
    std::lock_guard<std::mutex> lk(mu_);
    auto it = flows_.constFind(key);
    if (it != flows_.constEnd()) {
        return it->phase;
    }
    auto t = terminal_.constFind(key);
    return t != terminal_.constEnd() ? t->phase : FlowPhase::NotStarted;
}

AuthError AuthorizationFlow::LastFailure(const QString& email) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto t = terminal_.constFind(NormalizeEmail(email));
    if (t == terminal_.constEnd() || t->phase != FlowPhase::Failed) {
        return AuthError{};
    }
    return t->error;
}

void AuthorizationFlow::FailLocked(const QString& key, const AuthError& error)
{
    flows_.remove(key);
    Terminal failed;
    failed.phase = FlowPhase::Failed;
    failed.error = error;
    terminal_.insert(key, failed);
    AuditFailure(key, error);
}

} // namespace gsuite::auth
