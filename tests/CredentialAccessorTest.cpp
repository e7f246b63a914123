#include <optional>

#include <QDateTime>
#include <QTemporaryDir>

#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "auth/CredentialAccessor.hpp"

using gsuite::auth::AuthError;
using gsuite::auth::CredentialAccessor;
using gsuite::auth::ErrorKind;
using gsuite::db::Account;
using gsuite::db::Credential;
using gsuite::test::ErrorJson;
using gsuite::test::FakeTokenClient;
using gsuite::test::TokenJson;

namespace {

const QString kEmail = "alice@example.com";

class CredentialAccessorTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir_.isValid());
        cfg_ = gsuite::test::MakeTestConfig(dir_, 8080);

        AuthError err;
        ASSERT_TRUE(registry_.Open(cfg_.accountsDbPath, err));
        ASSERT_TRUE(store_.Open(cfg_.credentialsDir, err));
    }

    qint64 Now() const { return QDateTime::currentDateTimeUtc().toSecsSinceEpoch(); }

    void Register()
    {
        Account a;
        a.email = kEmail;
        AuthError err;
        ASSERT_TRUE(registry_.Upsert(a, err));
    }

    void StoreCredential(const QString& access, const QString& refresh, qint64 expiresAt)
    {
        Credential c;
        c.accessToken = access;
        c.refreshToken = refresh;
        c.expiresAtUtc = expiresAt;
        c.scopes = cfg_.scopes;
        AuthError err;
        ASSERT_TRUE(store_.Save(kEmail, c, err));
    }

    std::optional<Credential> Stored()
    {
        std::optional<Credential> c;
        AuthError err;
        EXPECT_TRUE(store_.Load(kEmail, c, err));
        return c;
    }

    QTemporaryDir dir_;
    gsuite::core::config::ManagerConfig cfg_;
    gsuite::db::AccountRegistry registry_;
    gsuite::db::CredentialStore store_;
    FakeTokenClient tokens_;
    CredentialAccessor accessor_{cfg_, registry_, store_, tokens_};
};

TEST_F(CredentialAccessorTest, UnregisteredAccountIsUnknownEvenWithCredential)
{
    StoreCredential("ya29.orphan", "1//r", Now() + 3600);

    QString token;
    AuthError err;
    EXPECT_FALSE(accessor_.GetValidToken(kEmail, token, err));
    EXPECT_EQ(err.kind, ErrorKind::UnknownAccount);
    EXPECT_TRUE(token.isEmpty());
}

TEST_F(CredentialAccessorTest, RegisteredWithoutCredentialIsNotAuthorized)
{
    Register();

    QString token;
    AuthError err;
    EXPECT_FALSE(accessor_.GetValidToken(kEmail, token, err));
    EXPECT_EQ(err.kind, ErrorKind::NotAuthorized);
    EXPECT_EQ(tokens_.CallCount(), 0);
}

TEST_F(CredentialAccessorTest, FreshTokenIsReturnedWithoutRefresh)
{
    Register();
    StoreCredential("ya29.fresh", "1//r", Now() + 3600);

    QString token;
    AuthError err;
    ASSERT_TRUE(accessor_.GetValidToken("ALICE@example.com", token, err));
    EXPECT_EQ(token, "ya29.fresh");
    EXPECT_EQ(tokens_.CallCount(), 0);
}

TEST_F(CredentialAccessorTest, ExpiredTokenIsRefreshedExactlyOnce)
{
    Register();
    StoreCredential("ya29.old", "1//r", Now() - 10);
    tokens_.PushJson(200, TokenJson("ya29.new", QString(), 3600));

    QString token;
    AuthError err;
    ASSERT_TRUE(accessor_.GetValidToken(kEmail, token, err)) << gsuite::auth::Describe(err).toStdString();
    EXPECT_EQ(token, "ya29.new");
    EXPECT_EQ(tokens_.CallCount(), 1);
    EXPECT_EQ(tokens_.LastCall().form.queryItemValue("grant_type"), "refresh_token");

    const std::optional<Credential> stored = Stored();
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->accessToken, "ya29.new");
    EXPECT_EQ(stored->refreshToken, "1//r");
    EXPECT_GT(stored->expiresAtUtc, Now());

    ASSERT_TRUE(accessor_.GetValidToken(kEmail, token, err));
    EXPECT_EQ(token, "ya29.new");
    EXPECT_EQ(tokens_.CallCount(), 1);
}

TEST_F(CredentialAccessorTest, TokenInsideSafetyMarginIsRefreshed)
{
    Register();
    StoreCredential("ya29.almost", "1//r", Now() + 30);
    tokens_.PushJson(200, TokenJson("ya29.new", "1//rotated", 3600));

    QString token;
    AuthError err;
    ASSERT_TRUE(accessor_.GetValidToken(kEmail, token, err));
    EXPECT_EQ(token, "ya29.new");
    ASSERT_TRUE(Stored().has_value());
    EXPECT_EQ(Stored()->refreshToken, "1//rotated");
}

TEST_F(CredentialAccessorTest, ExpiredWithoutRefreshTokenRequiresReauthorization)
{
    Register();
    StoreCredential("ya29.old", QString(), Now() - 10);

    QString token;
    AuthError err;
    EXPECT_FALSE(accessor_.GetValidToken(kEmail, token, err));
    EXPECT_EQ(err.kind, ErrorKind::ReauthorizationRequired);
    EXPECT_EQ(tokens_.CallCount(), 0);
    EXPECT_FALSE(Stored().has_value());

    std::optional<Account> account;
    ASSERT_TRUE(registry_.Get(kEmail, account, err));
    EXPECT_TRUE(account.has_value());
}

TEST_F(CredentialAccessorTest, RevokedGrantDeletesCredentialButKeepsAccount)
{
    Register();
    StoreCredential("ya29.old", "1//revoked", Now() - 10);
    tokens_.PushJson(400, ErrorJson("invalid_grant"));

    QString token;
    AuthError err;
    EXPECT_FALSE(accessor_.GetValidToken(kEmail, token, err));
    EXPECT_EQ(err.kind, ErrorKind::ReauthorizationRequired);
    EXPECT_FALSE(Stored().has_value());

    std::optional<Account> account;
    ASSERT_TRUE(registry_.Get(kEmail, account, err));
    EXPECT_TRUE(account.has_value());

    // Now it simply has no credential.
    EXPECT_FALSE(accessor_.GetValidToken(kEmail, token, err));
    EXPECT_EQ(err.kind, ErrorKind::NotAuthorized);
}

TEST_F(CredentialAccessorTest, ProviderOutageKeepsCredential)
{
    Register();
    StoreCredential("ya29.old", "1//r", Now() - 10);
    tokens_.PushJson(503, ErrorJson("backend_error"));
    tokens_.PushTransportFailure("connection refused");

    QString token;
    AuthError err;
    EXPECT_FALSE(accessor_.GetValidToken(kEmail, token, err));
    EXPECT_EQ(err.kind, ErrorKind::NetworkError);
    EXPECT_FALSE(accessor_.GetValidToken(kEmail, token, err));
    EXPECT_EQ(err.kind, ErrorKind::NetworkError);

    const std::optional<Credential> stored = Stored();
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->refreshToken, "1//r");
}

} // namespace
