#include <QCryptographicHash>
#include <QDateTime>
#include <QRegularExpression>
#include <QTemporaryDir>
#include <QUrlQuery>

#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "core/oauth/OAuthBroker.h"

using gsuite::auth::AuthError;
using gsuite::auth::ErrorKind;
using gsuite::core::oauth::OAuthBroker;
using gsuite::core::oauth::OAuthResult;
using gsuite::test::ErrorJson;
using gsuite::test::FakeTokenClient;
using gsuite::test::TokenJson;

namespace {

class OAuthBrokerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir_.isValid());
        cfg_ = gsuite::test::MakeTestConfig(dir_, 8080);
    }

    qint64 Now() const { return QDateTime::currentDateTimeUtc().toSecsSinceEpoch(); }

    QTemporaryDir dir_;
    gsuite::core::config::ManagerConfig cfg_;
    FakeTokenClient tokens_;
};

TEST_F(OAuthBrokerTest, AuthorizationUrlCarriesGrantParameters)
{
    const QUrl url = OAuthBroker::BuildAuthorizationUrl(cfg_, "st4te", "ch4llenge", "alice@example.com");
    const QUrlQuery q(url);

    EXPECT_EQ(url.host(), "accounts.google.com");
    EXPECT_EQ(q.queryItemValue("client_id"), cfg_.clientId);
    EXPECT_EQ(q.queryItemValue("redirect_uri", QUrl::FullyDecoded), cfg_.redirectUri);
    EXPECT_EQ(q.queryItemValue("response_type"), "code");
    EXPECT_EQ(q.queryItemValue("scope", QUrl::FullyDecoded), cfg_.scopes.join(" "));
    EXPECT_EQ(q.queryItemValue("access_type"), "offline");
    EXPECT_EQ(q.queryItemValue("prompt"), "consent");
    EXPECT_EQ(q.queryItemValue("state"), "st4te");
    EXPECT_EQ(q.queryItemValue("code_challenge"), "ch4llenge");
    EXPECT_EQ(q.queryItemValue("code_challenge_method"), "S256");
    EXPECT_EQ(q.queryItemValue("login_hint", QUrl::FullyDecoded), "alice@example.com");
}

TEST_F(OAuthBrokerTest, PkceChallengeIsSha256OfVerifier)
{
    const gsuite::core::oauth::PkcePair pkce = OAuthBroker::MakePkce();

    EXPECT_GE(pkce.verifier.size(), 43);
    EXPECT_LE(pkce.verifier.size(), 128);
    const QByteArray expected = QCryptographicHash::hash(pkce.verifier.toUtf8(), QCryptographicHash::Sha256)
                                    .toBase64(QByteArray::Base64UrlEncoding | QByteArray::OmitTrailingEquals);
    EXPECT_EQ(pkce.challenge, QString::fromLatin1(expected));
}

TEST_F(OAuthBrokerTest, RandomTokensAreUrlSafeAndDistinct)
{
    const QString a = OAuthBroker::RandomUrlSafe(24);
    const QString b = OAuthBroker::RandomUrlSafe(24);
    EXPECT_NE(a, b);
    EXPECT_EQ(a.size(), 32);
    EXPECT_TRUE(QRegularExpression("^[A-Za-z0-9_-]+$").match(a).hasMatch());
}

TEST_F(OAuthBrokerTest, ExchangePostsCodeVerifierAndRedirect)
{
    tokens_.PushJson(200, TokenJson("ya29.new", "1//refresh", 3599));

    OAuthResult out;
    AuthError err;
    ASSERT_TRUE(OAuthBroker::ExchangeCode(tokens_, cfg_, "4/code", "verifier", out, err));

    const FakeTokenClient::Call call = tokens_.LastCall();
    EXPECT_EQ(call.endpoint, QUrl(cfg_.tokenEndpoint));
    EXPECT_EQ(call.form.queryItemValue("grant_type"), "authorization_code");
    EXPECT_EQ(call.form.queryItemValue("code", QUrl::FullyDecoded), "4/code");
    EXPECT_EQ(call.form.queryItemValue("code_verifier"), "verifier");
    EXPECT_EQ(call.form.queryItemValue("client_id"), cfg_.clientId);
    EXPECT_EQ(call.form.queryItemValue("client_secret"), cfg_.clientSecret);
    EXPECT_EQ(call.form.queryItemValue("redirect_uri", QUrl::FullyDecoded), cfg_.redirectUri);

    EXPECT_EQ(out.accessToken, "ya29.new");
    EXPECT_EQ(out.refreshToken, "1//refresh");
    EXPECT_GT(out.expiresAtUtc, Now() + 3500);
    EXPECT_EQ(out.scopes, cfg_.scopes);
}

TEST_F(OAuthBrokerTest, GrantedScopeFieldIsSplit)
{
    QJsonObject body = TokenJson("ya29.new", QString(), 3600);
    body.insert("scope", "openid https://mail.google.com/");
    tokens_.PushJson(200, body);

    OAuthResult out;
    AuthError err;
    ASSERT_TRUE(OAuthBroker::ExchangeCode(tokens_, cfg_, "code", "v", out, err));
    EXPECT_EQ(out.scopes, QStringList({"openid", "https://mail.google.com/"}));
    EXPECT_TRUE(out.refreshToken.isEmpty());
}

TEST_F(OAuthBrokerTest, MissingExpiresInDefaultsToOneHour)
{
    tokens_.PushJson(200, QJsonObject{{"access_token", "ya29.new"}});

    OAuthResult out;
    AuthError err;
    ASSERT_TRUE(OAuthBroker::ExchangeCode(tokens_, cfg_, "code", "v", out, err));
    EXPECT_GE(out.expiresAtUtc, Now() + 3590);
    EXPECT_LE(out.expiresAtUtc, Now() + 3600);
}

TEST_F(OAuthBrokerTest, ProviderRejectionMapsToErrorKinds)
{
    struct Case {
        int status;
        QString error;
        ErrorKind expected;
    };
    const Case cases[] = {
        {400, "invalid_grant", ErrorKind::ExchangeFailed},
        {400, "invalid_request", ErrorKind::ExchangeFailed},
        {401, "invalid_client", ErrorKind::ConfigInvalid},
        {400, "unauthorized_client", ErrorKind::ConfigInvalid},
        {503, "backend_error", ErrorKind::NetworkError},
    };

    for (const Case& c : cases) {
        tokens_.PushJson(c.status, ErrorJson(c.error));
        OAuthResult out;
        AuthError err;
        EXPECT_FALSE(OAuthBroker::ExchangeCode(tokens_, cfg_, "code", "v", out, err)) << c.error.toStdString();
        EXPECT_EQ(err.kind, c.expected) << c.error.toStdString();
        EXPECT_TRUE(err.detail.contains(c.error));
    }
}

TEST_F(OAuthBrokerTest, TransportFailureIsNetworkError)
{
    tokens_.PushTransportFailure("connection refused");

    OAuthResult out;
    AuthError err;
    EXPECT_FALSE(OAuthBroker::ExchangeCode(tokens_, cfg_, "code", "v", out, err));
    EXPECT_EQ(err.kind, ErrorKind::NetworkError);
}

TEST_F(OAuthBrokerTest, SuccessWithoutAccessTokenIsExchangeFailed)
{
    tokens_.PushJson(200, QJsonObject{{"token_type", "Bearer"}});

    OAuthResult out;
    AuthError err;
    EXPECT_FALSE(OAuthBroker::ExchangeCode(tokens_, cfg_, "code", "v", out, err));
    EXPECT_EQ(err.kind, ErrorKind::ExchangeFailed);
}

TEST_F(OAuthBrokerTest, RefreshKeepsRefreshTokenUnlessRotated)
{
    tokens_.PushJson(200, TokenJson("ya29.one", QString(), 3600));
    tokens_.PushJson(200, TokenJson("ya29.two", "1//rotated", 3600));

    OAuthResult out;
    AuthError err;
    ASSERT_TRUE(OAuthBroker::RefreshAccessToken(tokens_, cfg_, "1//original", out, err));
    EXPECT_EQ(tokens_.LastCall().form.queryItemValue("grant_type"), "refresh_token");
    EXPECT_EQ(tokens_.LastCall().form.queryItemValue("refresh_token", QUrl::FullyDecoded), "1//original");
    EXPECT_EQ(out.accessToken, "ya29.one");
    EXPECT_EQ(out.refreshToken, "1//original");

    ASSERT_TRUE(OAuthBroker::RefreshAccessToken(tokens_, cfg_, "1//original", out, err));
    EXPECT_EQ(out.accessToken, "ya29.two");
    EXPECT_EQ(out.refreshToken, "1//rotated");
}

TEST_F(OAuthBrokerTest, RefreshWithoutTokenNeverCallsProvider)
{
    OAuthResult out;
    AuthError err;
    EXPECT_FALSE(OAuthBroker::RefreshAccessToken(tokens_, cfg_, "  ", out, err));
    EXPECT_EQ(err.kind, ErrorKind::ReauthorizationRequired);
    EXPECT_EQ(tokens_.CallCount(), 0);
}

} // namespace
