#include "core/oauth/OAuthBroker.h"

#include <QByteArray>
#include <QCryptographicHash>
#include <QDateTime>
#include <QRandomGenerator>
#include <QUrlQuery>

namespace gsuite::core::oauth {

using gsuite::auth::AuthError;
using gsuite::auth::ErrorKind;
using gsuite::core::config::ManagerConfig;

namespace {

// Google access tokens live one hour; used when expires_in is missing.
constexpr int kDefaultExpiresInSeconds = 3600;

QString Base64Url(const QByteArray& in)
{
    QByteArray b = in.toBase64(QByteArray::Base64UrlEncoding | QByteArray::OmitTrailingEquals);
    return QString::fromUtf8(b);
}

void AddClientAuth(const ManagerConfig& cfg, QUrlQuery& form)
{
    form.addQueryItem("client_id", cfg.clientId);
    if (!cfg.clientSecret.trimmed().isEmpty()) {
        form.addQueryItem("client_secret", cfg.clientSecret);
    }
}

QString DescribeProviderError(const TokenResponse& resp)
{
    QString detail = QString("token-http-failed http=%1").arg(resp.httpStatus);
    if (resp.json.contains("error")) {
        detail += QString(" error=%1").arg(resp.json.value("error").toString());
    }
    if (resp.json.contains("error_description")) {
        detail += QString(" desc=%1").arg(resp.json.value("error_description").toString());
    }
    return detail;
}

bool PostAndInterpret(TokenClient& client,
                      const ManagerConfig& cfg,
                      const QUrlQuery& form,
                      OAuthResult& out,
                      AuthError& outError)
{
    TokenResponse resp;
    QString transportErr;
    if (!client.PostForm(QUrl(cfg.tokenEndpoint), form, resp, transportErr)) {
        outError.Set(ErrorKind::NetworkError, transportErr);
        return false;
    }

    if (resp.httpStatus >= 500) {
        outError.Set(ErrorKind::NetworkError, DescribeProviderError(resp));
        return false;
    }
    if (resp.httpStatus < 200 || resp.httpStatus >= 300) {
        const QString code = resp.json.value("error").toString();
        const bool clientProblem = code == "invalid_client" || code == "unauthorized_client";
        outError.Set(clientProblem ? ErrorKind::ConfigInvalid : ErrorKind::ExchangeFailed, DescribeProviderError(resp));
        return false;
    }

    const QString accessToken = resp.json.value("access_token").toString();
    if (accessToken.isEmpty()) {
        outError.Set(ErrorKind::ExchangeFailed, "missing-access-token");
        return false;
    }

    int expiresIn = resp.json.value("expires_in").toInt();
    if (expiresIn <= 0) {
        expiresIn = kDefaultExpiresInSeconds;
    }

    out.accessToken = accessToken;
    out.refreshToken = resp.json.value("refresh_token").toString();
    out.expiresAtUtc = QDateTime::currentDateTimeUtc().addSecs(expiresIn).toSecsSinceEpoch();

    const QString granted = resp.json.value("scope").toString().trimmed();
    out.scopes = granted.isEmpty() ? cfg.scopes : granted.split(' ', Qt::SkipEmptyParts);
    return true;
}

} // namespace

QString OAuthBroker::RandomUrlSafe(int bytes)
{
    QByteArray buf;
    buf.resize(bytes);
    QRandomGenerator* rng = QRandomGenerator::system();
    for (int i = 0; i < bytes; ++i) {
        buf[i] = static_cast<char>(rng->generate() & 0xFF);
    }
    return Base64Url(buf);
}

PkcePair OAuthBroker::MakePkce()
{
    PkcePair pair;
    pair.verifier = RandomUrlSafe(48);
    const QByteArray sha = QCryptographicHash::hash(pair.verifier.toUtf8(), QCryptographicHash::Sha256);
    pair.challenge = Base64Url(sha);
    return pair;
}

QUrl OAuthBroker::BuildAuthorizationUrl(const ManagerConfig& cfg,
                                        const QString& state,
                                        const QString& codeChallenge,
                                        const QString& loginHint)
{
    QUrl authUrl(cfg.authEndpoint);
    QUrlQuery aq;
    aq.addQueryItem("client_id", cfg.clientId);
    aq.addQueryItem("redirect_uri", cfg.redirectUri);
    aq.addQueryItem("response_type", "code");
    aq.addQueryItem("scope", cfg.scopes.join(" "));
    aq.addQueryItem("access_type", "offline");
    aq.addQueryItem("prompt", "consent");
    aq.addQueryItem("state", state);
    if (!codeChallenge.isEmpty()) {
        aq.addQueryItem("code_challenge", codeChallenge);
        aq.addQueryItem("code_challenge_method", "S256");
    }
    if (!loginHint.isEmpty()) {
        aq.addQueryItem("login_hint", loginHint);
    }
    authUrl.setQuery(aq);
    return authUrl;
}

bool OAuthBroker::ExchangeCode(TokenClient& client,
                               const ManagerConfig& cfg,
                               const QString& code,
                               const QString& codeVerifier,
                               OAuthResult& out,
                               AuthError& outError)
{
    outError.Clear();
    out = {};

    if (cfg.clientId.trimmed().isEmpty()) {
        outError.Set(ErrorKind::ConfigInvalid, "missing-client-id");
        return false;
    }
    if (code.trimmed().isEmpty()) {
        outError.Set(ErrorKind::ExchangeFailed, "missing-authorization-code");
        return false;
    }

    QUrlQuery form;
    AddClientAuth(cfg, form);
    form.addQueryItem("code", code);
    if (!codeVerifier.isEmpty()) {
        form.addQueryItem("code_verifier", codeVerifier);
    }
    form.addQueryItem("redirect_uri", cfg.redirectUri);
    form.addQueryItem("grant_type", "authorization_code");

    return PostAndInterpret(client, cfg, form, out, outError);
}

bool OAuthBroker::RefreshAccessToken(TokenClient& client,
                                     const ManagerConfig& cfg,
                                     const QString& refreshToken,
                                     OAuthResult& out,
                                     AuthError& outError)
{
    outError.Clear();
    out = {};

    if (cfg.clientId.trimmed().isEmpty()) {
        outError.Set(ErrorKind::ConfigInvalid, "missing-client-id");
        return false;
    }
    if (refreshToken.trimmed().isEmpty()) {
        outError.Set(ErrorKind::ReauthorizationRequired, "missing-refresh-token");
        return false;
    }

    QUrlQuery form;
    AddClientAuth(cfg, form);
    form.addQueryItem("refresh_token", refreshToken);
    form.addQueryItem("grant_type", "refresh_token");

    if (!PostAndInterpret(client, cfg, form, out, outError)) {
        return false;
    }
    if (out.refreshToken.isEmpty()) {
        out.refreshToken = refreshToken;
    }
    return true;
}

} // namespace gsuite::core::oauth
