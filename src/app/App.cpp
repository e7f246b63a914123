// src/app/App.cpp
#include "app/App.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>

#include <iostream>

#include "auth/AccountManager.hpp"
#include "core/config/ManagerConfig.h"
#include "core/logging/AuditLog.h"
#include "providers/google/google_env.hpp"

namespace gsuite::app {

using gsuite::auth::AccountManager;
using gsuite::auth::AuthError;
using gsuite::auth::ErrorKind;
using gsuite::core::logging::AuditLog;

namespace env = gsuite::providers::google::env;

int ExitCodeFor(const AuthError& err)
{
    switch (err.kind) {
    case ErrorKind::None:
        return kExitOk;
    case ErrorKind::InvalidArgument:
        return kExitUsage;
    case ErrorKind::ConfigInvalid:
        return kExitConfig;
    case ErrorKind::StorageUnwritable:
    case ErrorKind::StorageCorrupt:
        return kExitStorage;
    case ErrorKind::PortUnavailable:
        return kExitPort;
    case ErrorKind::AlreadyAuthorized:
    case ErrorKind::FlowAlreadyInProgress:
    case ErrorKind::NoPendingFlow:
        return kExitFlowState;
    case ErrorKind::StateMismatch:
    case ErrorKind::ProviderError:
    case ErrorKind::ExchangeFailed:
        return kExitProtocol;
    case ErrorKind::Timeout:
    case ErrorKind::Cancelled:
        return kExitTimeout;
    case ErrorKind::UnknownAccount:
    case ErrorKind::NotAuthorized:
    case ErrorKind::ReauthorizationRequired:
        return kExitCredential;
    case ErrorKind::NetworkError:
        return kExitNetwork;
    }
    return kExitUsage;
}

namespace {

int Fail(const AuthError& err)
{
    std::cerr << env::LOG_PREFIX << " FAIL " << gsuite::auth::Describe(err).toStdString() << std::endl;
    return ExitCodeFor(err);
}

int ListAccounts(AccountManager& manager)
{
    QVector<gsuite::db::Account> accounts;
    AuthError err;
    if (!manager.ListAccounts(accounts, err)) {
        return Fail(err);
    }

    for (const auto& a : accounts) {
        bool authorized = false;
        if (!manager.IsAccountAuthorized(a.email, authorized, err)) {
            return Fail(err);
        }
        std::cout << a.email.toStdString() << '\t'
                  << a.accountType.toStdString() << '\t'
                  << (authorized ? "authorized" : "not-authorized");
        if (!a.extraInfo.isEmpty()) {
            std::cout << '\t' << a.extraInfo.toStdString();
        }
        std::cout << '\n';
    }
    std::cout.flush();
    return kExitOk;
}

int Authorize(AccountManager& manager, const QString& email, bool force, int timeoutSeconds)
{
    QString url;
    AuthError err;
    if (!manager.BeginAuthorization(email, force, url, err)) {
        return Fail(err);
    }

    std::cout << "Open this URL in a browser and sign in as " << email.toStdString() << ":\n\n"
              << url.toStdString() << "\n\n"
              << "Waiting for the redirect on " << manager.Config().redirectUri.toStdString() << " ..."
              << std::endl;

    gsuite::db::Account account;
    if (!manager.AwaitAndComplete(email, timeoutSeconds, account, err)) {
        manager.CancelAuthorization(email);
        return Fail(err);
    }

    std::cout << env::LOG_PREFIX << " AUTHORIZED " << account.email.toStdString() << std::endl;
    return kExitOk;
}

int Remove(AccountManager& manager, const QString& email)
{
    bool removed = false;
    AuthError err;
    if (!manager.RemoveAccount(email, removed, err)) {
        return Fail(err);
    }
    std::cout << env::LOG_PREFIX << (removed ? " REMOVED " : " NOT_REGISTERED ") << email.toStdString() << std::endl;
    return kExitOk;
}

int PrintToken(AccountManager& manager, const QString& email)
{
    QString token;
    AuthError err;
    if (!manager.GetValidToken(email, token, err)) {
        return Fail(err);
    }
    std::cout << token.toStdString() << std::endl;
    return kExitOk;
}

} // namespace

int App::Run(int argc, char* argv[])
{
    QCoreApplication qtApp(argc, argv);

    QCoreApplication::setOrganizationName("gsuite");
    QCoreApplication::setApplicationName("gsuite-accounts");

    QCommandLineParser parser;
    parser.setApplicationDescription("Manage authorized Google Workspace accounts.");
    parser.addHelpOption();

    const QCommandLineOption listOpt("list", "List registered accounts and whether they hold a credential.");
    const QCommandLineOption authorizeOpt("authorize", "Authorize <email> through the browser.", "email");
    const QCommandLineOption reauthorizeOpt("reauthorize", "Authorize <email> again even if its credential is valid.", "email");
    const QCommandLineOption removeOpt("remove", "Remove <email> and its credential.", "email");
    const QCommandLineOption tokenOpt("token", "Print a valid access token for <email>, refreshing if needed.", "email");
    const QCommandLineOption timeoutOpt("timeout", "Seconds to wait for the browser redirect.", "seconds");
    const QCommandLineOption gauthOpt("gauth-file", "Client secrets JSON (overrides GSUITE_GAUTH_FILE).", "path");
    const QCommandLineOption accountsDbOpt("accounts-db", "Account registry database (overrides GSUITE_ACCOUNTS_DB).", "path");
    const QCommandLineOption credentialsDirOpt("credentials-dir", "Credential directory (overrides GSUITE_CREDENTIALS_DIR).", "path");

    parser.addOption(listOpt);
    parser.addOption(authorizeOpt);
    parser.addOption(reauthorizeOpt);
    parser.addOption(removeOpt);
    parser.addOption(tokenOpt);
    parser.addOption(timeoutOpt);
    parser.addOption(gauthOpt);
    parser.addOption(accountsDbOpt);
    parser.addOption(credentialsDirOpt);
    parser.process(qtApp);

    const int commands = (parser.isSet(listOpt) ? 1 : 0) + (parser.isSet(authorizeOpt) ? 1 : 0)
        + (parser.isSet(reauthorizeOpt) ? 1 : 0) + (parser.isSet(removeOpt) ? 1 : 0) + (parser.isSet(tokenOpt) ? 1 : 0);
    if (commands != 1) {
        std::cerr << "exactly one of --list, --authorize, --reauthorize, --remove, --token is required\n";
        parser.showHelp(kExitUsage);
    }

    int timeoutSeconds = 0;
    if (parser.isSet(timeoutOpt)) {
        bool ok = false;
        timeoutSeconds = parser.value(timeoutOpt).toInt(&ok);
        if (!ok || timeoutSeconds <= 0) {
            AuthError err;
            err.Set(ErrorKind::InvalidArgument, "--timeout must be a positive number of seconds");
            return Fail(err);
        }
    }

    gsuite::core::config::ManagerConfig cfg;
    AuthError err;
    if (!gsuite::core::config::ConfigFromEnvironment(cfg, err, parser.value(gauthOpt))) {
        return Fail(err);
    }
    if (parser.isSet(accountsDbOpt)) {
        cfg.accountsDbPath = parser.value(accountsDbOpt);
    }
    if (parser.isSet(credentialsDirOpt)) {
        cfg.credentialsDir = parser.value(credentialsDirOpt);
    }

    AccountManager manager(cfg);
    if (!manager.Open(err)) {
        return Fail(err);
    }

    AuditLog::AppStart(cfg.accountsDbPath.toStdString());

    int rc = kExitOk;
    if (parser.isSet(listOpt)) {
        rc = ListAccounts(manager);
    } else if (parser.isSet(authorizeOpt)) {
        rc = Authorize(manager, parser.value(authorizeOpt), false, timeoutSeconds);
    } else if (parser.isSet(reauthorizeOpt)) {
        rc = Authorize(manager, parser.value(reauthorizeOpt), true, timeoutSeconds);
    } else if (parser.isSet(removeOpt)) {
        rc = Remove(manager, parser.value(removeOpt));
    } else {
        rc = PrintToken(manager, parser.value(tokenOpt));
    }

    AuditLog::AppExit(rc);
    return rc;
}

} // namespace gsuite::app
