#include <optional>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "db/CredentialStore.hpp"

using gsuite::auth::AuthError;
using gsuite::auth::ErrorKind;
using gsuite::db::Credential;
using gsuite::db::CredentialStore;

namespace {

constexpr QFileDevice::Permissions kGroupOrOther = QFileDevice::ReadGroup | QFileDevice::WriteGroup
    | QFileDevice::ExeGroup | QFileDevice::ReadOther | QFileDevice::WriteOther | QFileDevice::ExeOther;

Credential MakeCredential(const QString& access, const QString& refresh, qint64 expiresAt)
{
    Credential c;
    c.accessToken = access;
    c.refreshToken = refresh;
    c.expiresAtUtc = expiresAt;
    c.scopes = QStringList{"openid", "https://mail.google.com/"};
    return c;
}

class CredentialStoreTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir_.isValid());
        credDir_ = QDir(dir_.path()).filePath("creds/nested");
        AuthError err;
        ASSERT_TRUE(store_.Open(credDir_, err)) << gsuite::auth::Describe(err).toStdString();
    }

    QTemporaryDir dir_;
    QString credDir_;
    CredentialStore store_;
};

TEST_F(CredentialStoreTest, CreatedDirectoryIsOwnerOnly)
{
    const QFileInfo info(credDir_);
    ASSERT_TRUE(info.isDir());
    EXPECT_EQ((info.permissions() & kGroupOrOther).toInt(), 0);
}

TEST_F(CredentialStoreTest, LoadOfMissingRecordIsNotAnError)
{
    std::optional<Credential> loaded;
    AuthError err;
    EXPECT_TRUE(store_.Load("alice@example.com", loaded, err));
    EXPECT_FALSE(loaded.has_value());
}

TEST_F(CredentialStoreTest, SaveThenLoad)
{
    AuthError err;
    ASSERT_TRUE(store_.Save("Alice@Example.com", MakeCredential("ya29.a", "1//r", 1900000000), err));

    std::optional<Credential> loaded;
    ASSERT_TRUE(store_.Load("alice@example.com", loaded, err));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->accessToken, "ya29.a");
    EXPECT_EQ(loaded->refreshToken, "1//r");
    EXPECT_EQ(loaded->expiresAtUtc, 1900000000);
    EXPECT_EQ(loaded->scopes, QStringList({"openid", "https://mail.google.com/"}));
}

TEST_F(CredentialStoreTest, RecordFileIsNamedPerAccountAndOwnerOnly)
{
    AuthError err;
    ASSERT_TRUE(store_.Save("alice@example.com", MakeCredential("ya29.a", "1//r", 1900000000), err));

    const QString expected = QDir(credDir_).filePath(".oauth2.alice@example.com.json");
    EXPECT_EQ(QFileInfo(store_.FilePathFor("ALICE@example.com")).absoluteFilePath(), QFileInfo(expected).absoluteFilePath());

    const QFileInfo info(expected);
    ASSERT_TRUE(info.exists());
    EXPECT_EQ((info.permissions() & kGroupOrOther).toInt(), 0);
    EXPECT_TRUE(info.permissions().testFlag(QFileDevice::ReadOwner));
}

TEST_F(CredentialStoreTest, MissingRefreshTokenIsStoredAsNull)
{
    AuthError err;
    ASSERT_TRUE(store_.Save("alice@example.com", MakeCredential("ya29.a", QString(), 1900000000), err));

    QFile f(store_.FilePathFor("alice@example.com"));
    ASSERT_TRUE(f.open(QIODevice::ReadOnly));
    const QJsonObject o = QJsonDocument::fromJson(f.readAll()).object();
    EXPECT_TRUE(o.value("refresh_token").isNull());
    EXPECT_EQ(o.value("access_token").toString(), "ya29.a");

    std::optional<Credential> loaded;
    ASSERT_TRUE(store_.Load("alice@example.com", loaded, err));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded->HasRefreshToken());
}

TEST_F(CredentialStoreTest, SaveReplacesWholeRecordWithoutLeftovers)
{
    AuthError err;
    ASSERT_TRUE(store_.Save("alice@example.com", MakeCredential("first", "1//r", 100), err));
    Credential second = MakeCredential("second", QString(), 200);
    second.scopes = QStringList{"openid"};
    ASSERT_TRUE(store_.Save("alice@example.com", second, err));

    std::optional<Credential> loaded;
    ASSERT_TRUE(store_.Load("alice@example.com", loaded, err));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->accessToken, "second");
    EXPECT_FALSE(loaded->HasRefreshToken());
    EXPECT_EQ(loaded->scopes, QStringList({"openid"}));

    const QStringList entries = QDir(credDir_).entryList(QDir::Files | QDir::Hidden);
    EXPECT_EQ(entries, QStringList({".oauth2.alice@example.com.json"}));
}

TEST_F(CredentialStoreTest, DeleteReportsWhetherARecordExisted)
{
    AuthError err;
    ASSERT_TRUE(store_.Save("alice@example.com", MakeCredential("ya29.a", "1//r", 100), err));

    bool deleted = false;
    ASSERT_TRUE(store_.Delete("alice@example.com", deleted, err));
    EXPECT_TRUE(deleted);
    EXPECT_FALSE(QFile::exists(store_.FilePathFor("alice@example.com")));

    ASSERT_TRUE(store_.Delete("alice@example.com", deleted, err));
    EXPECT_FALSE(deleted);
}

TEST_F(CredentialStoreTest, UnparsableRecordIsStorageCorrupt)
{
    QFile f(store_.FilePathFor("alice@example.com"));
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write("{not json");
    f.close();

    std::optional<Credential> loaded;
    AuthError err;
    EXPECT_FALSE(store_.Load("alice@example.com", loaded, err));
    EXPECT_EQ(err.kind, ErrorKind::StorageCorrupt);
}

TEST_F(CredentialStoreTest, RejectsPathLikeEmails)
{
    AuthError err;
    EXPECT_FALSE(store_.Save("../evil@example.com", MakeCredential("x", "", 1), err));
    EXPECT_EQ(err.kind, ErrorKind::InvalidArgument);
}

} // namespace
