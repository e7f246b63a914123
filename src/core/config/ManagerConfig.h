#pragma once

#include <QString>
#include <QStringList>

#include "auth/AuthError.hpp"

namespace gsuite::core::config {

// Contents of the client secrets JSON downloaded from the Google cloud console.
struct ClientSecrets {
    QString clientId;
    QString clientSecret;
    QString authUri;
    QString tokenUri;
    QStringList redirectUris;
};

// Everything the account manager needs, passed in at construction. Nothing here is
// read from the environment implicitly; see ConfigFromEnvironment().
struct ManagerConfig {
    QString accountsDbPath;
    QString credentialsDir;
    QString auditLogPath;            // empty = no audit log

    QString clientId;
    QString clientSecret;
    QString authEndpoint;
    QString tokenEndpoint;
    QStringList scopes;

    // Loopback redirect, e.g. http://localhost:8080/. Its port and path are where the
    // callback listener binds and matches.
    QString redirectUri;

    int callbackTimeoutSeconds = 300;
    int expirySafetyMarginSeconds = 60;
    int networkTimeoutSeconds = 30;
};

// Google endpoints, scopes and redirect; storage in the working directory.
ManagerConfig DefaultConfig();

// Accepts both the "installed" and the "web" layout.
bool LoadClientSecrets(const QString& path, ClientSecrets& out, gsuite::auth::AuthError& outError);

// Copies client id/secret/endpoints into cfg and picks the first loopback redirect URI.
void ApplyClientSecrets(const ClientSecrets& secrets, ManagerConfig& cfg);

// DefaultConfig() + GSUITE_* overrides + the client secrets file. A non-empty
// gauthFileOverride wins over GSUITE_GAUTH_FILE.
bool ConfigFromEnvironment(ManagerConfig& out,
                           gsuite::auth::AuthError& outError,
                           const QString& gauthFileOverride = QString());

bool ValidateConfig(const ManagerConfig& cfg, gsuite::auth::AuthError& outError);

int CallbackPort(const ManagerConfig& cfg);
QString CallbackPath(const ManagerConfig& cfg);

} // namespace gsuite::core::config
