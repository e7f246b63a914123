#include "auth/AccountManager.hpp"

#include <utility>

#include "core/logging/AuditLog.h"
#include "db/Email.hpp"

namespace gsuite::auth {

using gsuite::core::logging::AuditLog;
using gsuite::db::Account;

AccountManager::AccountManager(gsuite::core::config::ManagerConfig cfg)
    : cfg_(std::move(cfg))
    , ownedTokens_(std::make_unique<gsuite::core::oauth::HttpTokenClient>(cfg_.networkTimeoutSeconds))
    , tokens_(ownedTokens_.get())
{
}

AccountManager::AccountManager(gsuite::core::config::ManagerConfig cfg, gsuite::core::oauth::TokenClient& tokens)
    : cfg_(std::move(cfg))
    , tokens_(&tokens)
{
}

AccountManager::~AccountManager()
{
    if (flow_) {
        flow_->CancelAll();
    }
}

bool AccountManager::Open(AuthError& outError)
{
    outError.Clear();

    if (!gsuite::core::config::ValidateConfig(cfg_, outError)) {
        return false;
    }

    if (!cfg_.auditLogPath.isEmpty()) {
        AuditLog::Init(cfg_.auditLogPath.toStdString());
    }

    if (!registry_.Open(cfg_.accountsDbPath, outError)) {
        return false;
    }
    if (!store_.Open(cfg_.credentialsDir, outError)) {
        return false;
    }

    flow_ = std::make_unique<AuthorizationFlow>(cfg_, registry_, store_, *tokens_);
    accessor_ = std::make_unique<CredentialAccessor>(cfg_, registry_, store_, *tokens_);
    return true;
}

bool AccountManager::IsOpen() const
{
    return flow_ != nullptr;
}

bool AccountManager::RequireOpen(AuthError& outError) const
{
    if (!IsOpen()) {
        outError.Set(ErrorKind::ConfigInvalid, "account manager not opened");
        return false;
    }
    return true;
}

bool AccountManager::ListAccounts(QVector<Account>& outAccounts, AuthError& outError)
{
    outError.Clear();
    outAccounts.clear();
    if (!RequireOpen(outError)) {
        return false;
    }
    return registry_.List(outAccounts, outError);
}

bool AccountManager::GetAccount(const QString& email, std::optional<Account>& outAccount, AuthError& outError)
{
    outError.Clear();
    outAccount.reset();
    if (!RequireOpen(outError)) {
        return false;
    }
    return registry_.Get(email, outAccount, outError);
}

bool AccountManager::RemoveAccount(const QString& email, bool& outRemoved, AuthError& outError)
{
    outError.Clear();
    outRemoved = false;
    if (!RequireOpen(outError)) {
        return false;
    }

    const QString key = gsuite::db::NormalizeEmail(email);
    if (!gsuite::db::LooksLikeEmail(key)) {
        outError.Set(ErrorKind::InvalidArgument, "valid email required");
        return false;
    }

    flow_->Cancel(key);

    // A credential left behind by a failed delete is orphaned and rejected by the accessor.
    if (!registry_.Remove(key, outRemoved, outError)) {
        return false;
    }

    bool deleted = false;
    return store_.Delete(key, deleted, outError);
}

bool AccountManager::UpdateAccountInfo(const QString& email,
                                       const QString& accountType,
                                       const QString& extraInfo,
                                       AuthError& outError)
{
    outError.Clear();
    if (!RequireOpen(outError)) {
        return false;
    }

    std::optional<Account> existing;
    if (!registry_.Get(email, existing, outError)) {
        return false;
    }
    if (!existing) {
        outError.Set(ErrorKind::UnknownAccount, QString("%1 is not registered").arg(gsuite::db::NormalizeEmail(email)));
        return false;
    }

    Account updated = *existing;
    updated.accountType = accountType.trimmed().isEmpty() ? QString("user") : accountType.trimmed();
    updated.extraInfo = extraInfo;
    return registry_.Upsert(updated, outError);
}

bool AccountManager::IsAccountAuthorized(const QString& email, bool& outAuthorized, AuthError& outError)
{
    outError.Clear();
    outAuthorized = false;
    if (!RequireOpen(outError)) {
        return false;
    }

    std::optional<Account> account;
    if (!registry_.Get(email, account, outError)) {
        return false;
    }
    if (!account) {
        return true;
    }

    std::optional<gsuite::db::Credential> cred;
    if (!store_.Load(account->email, cred, outError)) {
        return false;
    }
    outAuthorized = cred.has_value();
    return true;
}

bool AccountManager::BeginAuthorization(const QString& email, bool forceReauth, QString& outUrl, AuthError& outError)
{
    outError.Clear();
    if (!RequireOpen(outError)) {
        return false;
    }
    return flow_->Begin(email, forceReauth, outUrl, outError);
}

bool AccountManager::CompleteAuthorization(const QString& email,
                                           const QString& code,
                                           const QString& state,
                                           Account& outAccount,
                                           AuthError& outError)
{
    outError.Clear();
    if (!RequireOpen(outError)) {
        return false;
    }
    return flow_->Complete(email, code, state, outAccount, outError);
}

bool AccountManager::AwaitAndComplete(const QString& email, int timeoutSeconds, Account& outAccount, AuthError& outError)
{
    outError.Clear();
    if (!RequireOpen(outError)) {
        return false;
    }
    return flow_->AwaitAndComplete(email, timeoutSeconds, outAccount, outError);
}

void AccountManager::CancelAuthorization(const QString& email)
{
    if (flow_) {
        flow_->Cancel(email);
    }
}

FlowPhase AccountManager::AuthorizationPhase(const QString& email) const
{
    return flow_ ? flow_->Phase(email) : FlowPhase::NotStarted;
}

bool AccountManager::GetValidToken(const QString& email, QString& outAccessToken, AuthError& outError)
{
    outError.Clear();
    if (!RequireOpen(outError)) {
        return false;
    }
    return accessor_->GetValidToken(email, outAccessToken, outError);
}

} // namespace gsuite::auth
