#include "core/config/ManagerConfig.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUrl>

#include "providers/google/GoogleProfile.hpp"
#include "providers/google/google_env.hpp"

namespace gsuite::core::config {

using gsuite::auth::AuthError;
using gsuite::auth::ErrorKind;

namespace env = gsuite::providers::google::env;

static bool IsLoopbackHost(const QString& host)
{
    const QString lowered = host.trimmed().toLower();
    return lowered == "localhost" || lowered == "127.0.0.1";
}

static bool IsLoopbackHttp(const QUrl& url)
{
    return url.isValid() && url.scheme().compare("http", Qt::CaseInsensitive) == 0 && IsLoopbackHost(url.host());
}

ManagerConfig DefaultConfig()
{
    const gsuite::providers::google::GoogleProfile profile;

    ManagerConfig cfg;
    cfg.accountsDbPath = env::kDefaultAccountsDb;
    cfg.credentialsDir = env::kDefaultCredentialsDir;
    cfg.authEndpoint = profile.OAuth().authorizeUrl;
    cfg.tokenEndpoint = profile.OAuth().tokenUrl;
    cfg.scopes = profile.Scopes();
    cfg.redirectUri = profile.DefaultRedirectUri();
    return cfg;
}

bool LoadClientSecrets(const QString& path, ClientSecrets& out, AuthError& outError)
{
    outError.Clear();
    out = ClientSecrets{};

    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        outError.Set(ErrorKind::ConfigInvalid, QString("client-secrets-unreadable path=%1 err=%2").arg(path, f.errorString()));
        return false;
    }

    QJsonParseError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        outError.Set(ErrorKind::ConfigInvalid, QString("client-secrets-json-parse-failed err=%1").arg(pe.errorString()));
        return false;
    }

    const QJsonObject root = doc.object();
    QJsonObject section;
    if (root.value("installed").isObject()) {
        section = root.value("installed").toObject();
    } else if (root.value("web").isObject()) {
        section = root.value("web").toObject();
    } else {
        outError.Set(ErrorKind::ConfigInvalid, "client-secrets-missing-installed-or-web");
        return false;
    }

    out.clientId = section.value("client_id").toString().trimmed();
    out.clientSecret = section.value("client_secret").toString().trimmed();
    out.authUri = section.value("auth_uri").toString().trimmed();
    out.tokenUri = section.value("token_uri").toString().trimmed();
    for (const QJsonValue& v : section.value("redirect_uris").toArray()) {
        const QString uri = v.toString().trimmed();
        if (!uri.isEmpty()) {
            out.redirectUris.push_back(uri);
        }
    }

    if (out.clientId.isEmpty()) {
        outError.Set(ErrorKind::ConfigInvalid, "client-secrets-missing-client-id");
        return false;
    }
    return true;
}

void ApplyClientSecrets(const ClientSecrets& secrets, ManagerConfig& cfg)
{
    cfg.clientId = secrets.clientId;
    cfg.clientSecret = secrets.clientSecret;
    if (!secrets.authUri.isEmpty()) {
        cfg.authEndpoint = secrets.authUri;
    }
    if (!secrets.tokenUri.isEmpty()) {
        cfg.tokenEndpoint = secrets.tokenUri;
    }

    const gsuite::providers::google::GoogleProfile profile;
    for (const QString& candidate : secrets.redirectUris) {
        QUrl url(candidate);
        if (!IsLoopbackHttp(url)) {
            continue;
        }
        // Installed-app clients register "http://localhost" without a port.
        if (url.port() <= 0) {
            url.setPort(profile.DefaultCallbackPort());
        }
        if (url.path().isEmpty()) {
            url.setPath("/");
        }
        cfg.redirectUri = url.toString();
        return;
    }
}

bool ConfigFromEnvironment(ManagerConfig& out, AuthError& outError, const QString& gauthFileOverride)
{
    outError.Clear();
    out = DefaultConfig();

    if (const auto v = env::ReadOptional(env::kAccountsDb)) {
        out.accountsDbPath = *v;
    }
    if (const auto v = env::ReadOptional(env::kCredentialsDir)) {
        out.credentialsDir = *v;
    }
    if (const auto v = env::ReadOptional(env::kAuditLog)) {
        out.auditLogPath = *v;
    }
    if (const auto v = env::ReadOptional(env::kCallbackTimeout)) {
        bool ok = false;
        const int seconds = v->toInt(&ok);
        if (!ok || seconds <= 0) {
            outError.Set(ErrorKind::ConfigInvalid, QString("%1 must be a positive integer").arg(env::kCallbackTimeout));
            return false;
        }
        out.callbackTimeoutSeconds = seconds;
    }

    const QString gauthFile = !gauthFileOverride.trimmed().isEmpty()
        ? gauthFileOverride.trimmed()
        : env::ReadOptional(env::kGauthFile).value_or(QString(env::kDefaultGauthFile));
    ClientSecrets secrets;
    if (!LoadClientSecrets(gauthFile, secrets, outError)) {
        return false;
    }
    ApplyClientSecrets(secrets, out);
    return ValidateConfig(out, outError);
}

bool ValidateConfig(const ManagerConfig& cfg, AuthError& outError)
{
    outError.Clear();

    if (cfg.accountsDbPath.trimmed().isEmpty()) {
        outError.Set(ErrorKind::ConfigInvalid, "accounts-db-path-empty");
        return false;
    }
    if (cfg.clientId.trimmed().isEmpty()) {
        outError.Set(ErrorKind::ConfigInvalid, "missing-client-id");
        return false;
    }
    if (!QUrl(cfg.authEndpoint).isValid() || cfg.authEndpoint.isEmpty()) {
        outError.Set(ErrorKind::ConfigInvalid, "invalid-auth-endpoint");
        return false;
    }
    if (!QUrl(cfg.tokenEndpoint).isValid() || cfg.tokenEndpoint.isEmpty()) {
        outError.Set(ErrorKind::ConfigInvalid, "invalid-token-endpoint");
        return false;
    }
    if (cfg.scopes.isEmpty()) {
        outError.Set(ErrorKind::ConfigInvalid, "no-scopes");
        return false;
    }

    const QUrl redirect(cfg.redirectUri);
    if (!IsLoopbackHttp(redirect)) {
        outError.Set(ErrorKind::ConfigInvalid, "redirect-uri must be http://localhost or http://127.0.0.1");
        return false;
    }
    if (redirect.port() <= 0) {
        outError.Set(ErrorKind::ConfigInvalid, "redirect-uri must carry a fixed port");
        return false;
    }
    if (cfg.callbackTimeoutSeconds <= 0 || cfg.expirySafetyMarginSeconds < 0 || cfg.networkTimeoutSeconds <= 0) {
        outError.Set(ErrorKind::ConfigInvalid, "timeouts must be positive");
        return false;
    }
    return true;
}

int CallbackPort(const ManagerConfig& cfg)
{
    return QUrl(cfg.redirectUri).port();
}

QString CallbackPath(const ManagerConfig& cfg)
{
    const QString path = QUrl(cfg.redirectUri).path();
    return path.isEmpty() ? QString("/") : path;
}

} // namespace gsuite::core::config
