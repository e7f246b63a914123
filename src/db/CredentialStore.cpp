#include "db/CredentialStore.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

#include "core/logging/AuditLog.h"
#include "db/Email.hpp"

namespace gsuite::db {

using gsuite::auth::AuthError;
using gsuite::auth::ErrorKind;
using gsuite::core::logging::AuditLog;

static constexpr QFileDevice::Permissions kOwnerFile = QFileDevice::ReadOwner | QFileDevice::WriteOwner;
static constexpr QFileDevice::Permissions kOwnerDir =
    QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner;

static QJsonObject ToJson(const QString& email, const Credential& c)
{
    QJsonObject o;
    o.insert("email", email);
    o.insert("access_token", c.accessToken);
    o.insert("refresh_token", c.HasRefreshToken() ? QJsonValue(c.refreshToken) : QJsonValue(QJsonValue::Null));
    o.insert("expires_at_utc", static_cast<qint64>(c.expiresAtUtc));
    o.insert("scopes", QJsonArray::fromStringList(c.scopes));
    return o;
}

static bool FromJson(const QJsonObject& o, Credential& out, QString& outErr)
{
    out = Credential{};

    const QJsonValue access = o.value("access_token");
    if (!access.isString()) {
        outErr = "access_token missing";
        return false;
    }
    out.accessToken = access.toString();

    const QJsonValue refresh = o.value("refresh_token");
    if (refresh.isString()) {
        out.refreshToken = refresh.toString();
    } else if (!refresh.isNull() && !refresh.isUndefined()) {
        outErr = "refresh_token has wrong type";
        return false;
    }

    const QJsonValue expiry = o.value("expires_at_utc");
    if (!expiry.isDouble()) {
        outErr = "expires_at_utc missing";
        return false;
    }
    out.expiresAtUtc = static_cast<qint64>(expiry.toDouble());

    const QJsonArray scopes = o.value("scopes").toArray();
    for (const QJsonValue& s : scopes) {
        if (s.isString()) {
            out.scopes.push_back(s.toString());
        }
    }
    return true;
}

bool CredentialStore::Open(const QString& directory, AuthError& outError)
{
    outError.Clear();

    const QString dir = directory.trimmed().isEmpty() ? QString(".") : directory.trimmed();
    QDir d(dir);
    if (!d.exists()) {
        if (!QDir().mkpath(dir)) {
            outError.Set(ErrorKind::StorageUnwritable, QString("CredentialStore::Open: cannot create %1").arg(dir));
            return false;
        }
        // Only restrict directories we created ourselves; "." may be shared.
        if (!QFile::setPermissions(dir, kOwnerDir)) {
            outError.Set(ErrorKind::StorageUnwritable, QString("CredentialStore::Open: cannot restrict %1").arg(dir));
            return false;
        }
    }

    const QFileInfo info(dir);
    if (!info.isDir() || !info.isWritable()) {
        outError.Set(ErrorKind::StorageUnwritable, QString("CredentialStore::Open: %1 not writable").arg(dir));
        return false;
    }

    directory_ = info.absoluteFilePath();
    return true;
}

bool CredentialStore::IsOpen() const
{
    return !directory_.isEmpty();
}

QString CredentialStore::Directory() const
{
    return directory_;
}

QString CredentialStore::FilePathFor(const QString& email) const
{
    return QDir(directory_).filePath(QString(".oauth2.%1.json").arg(NormalizeEmail(email)));
}

bool CredentialStore::RequireOpen(const char* op, const QString& email, AuthError& outError) const
{
    if (!IsOpen()) {
        outError.Set(ErrorKind::StorageUnwritable, QString("CredentialStore::%1: store not open").arg(op));
        return false;
    }
    if (!LooksLikeEmail(email)) {
        outError.Set(ErrorKind::InvalidArgument, QString("CredentialStore::%1: valid email required").arg(op));
        return false;
    }
    return true;
}

bool CredentialStore::Load(const QString& email, std::optional<Credential>& outCredential, AuthError& outError) const
{
    outError.Clear();
    outCredential.reset();
    if (!RequireOpen("Load", email, outError)) {
        return false;
    }

    QFile f(FilePathFor(email));
    if (!f.exists()) {
        return true;
    }
    if (!f.open(QIODevice::ReadOnly)) {
        outError.Set(ErrorKind::StorageCorrupt, QString("CredentialStore::Load: %1").arg(f.errorString()));
        return false;
    }

    QJsonParseError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        outError.Set(ErrorKind::StorageCorrupt, QString("CredentialStore::Load: json-parse-failed err=%1").arg(pe.errorString()));
        return false;
    }

    Credential c;
    QString err;
    if (!FromJson(doc.object(), c, err)) {
        outError.Set(ErrorKind::StorageCorrupt, QString("CredentialStore::Load: %1").arg(err));
        return false;
    }

    outCredential = c;
    return true;
}

bool CredentialStore::Save(const QString& email, const Credential& credential, AuthError& outError)
{
    outError.Clear();
    if (!RequireOpen("Save", email, outError)) {
        return false;
    }
    if (credential.accessToken.isEmpty()) {
        outError.Set(ErrorKind::InvalidArgument, "CredentialStore::Save: access_token required");
        return false;
    }

    const QString key = NormalizeEmail(email);
    const QString path = FilePathFor(key);

    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly)) {
        outError.Set(ErrorKind::StorageUnwritable, QString("CredentialStore::Save: %1").arg(f.errorString()));
        return false;
    }
    // Applies to the temp file, so the secret is never world-readable on disk.
    if (!f.setPermissions(kOwnerFile)) {
        f.cancelWriting();
        outError.Set(ErrorKind::StorageUnwritable, QString("CredentialStore::Save: chmod failed: %1").arg(f.errorString()));
        return false;
    }

    const QByteArray body = QJsonDocument(ToJson(key, credential)).toJson(QJsonDocument::Indented);
    if (f.write(body) != body.size()) {
        f.cancelWriting();
        outError.Set(ErrorKind::StorageUnwritable, QString("CredentialStore::Save: short write: %1").arg(f.errorString()));
        return false;
    }
    if (!f.commit()) {
        outError.Set(ErrorKind::StorageUnwritable, QString("CredentialStore::Save: commit failed: %1").arg(f.errorString()));
        return false;
    }
    if (!QFile::setPermissions(path, kOwnerFile)) {
        outError.Set(ErrorKind::StorageUnwritable, "CredentialStore::Save: chmod failed");
        return false;
    }

    AuditLog::Event("CREDENTIAL_SAVE",
                    QJsonObject{{"email", AuditLog::RedactEmail(key)},
                                {"refresh_token_present", credential.HasRefreshToken()},
                                {"expires_at_utc", static_cast<qint64>(credential.expiresAtUtc)}});
    return true;
}

bool CredentialStore::Delete(const QString& email, bool& outDeleted, AuthError& outError)
{
    outError.Clear();
    outDeleted = false;
    if (!RequireOpen("Delete", email, outError)) {
        return false;
    }

    QFile f(FilePathFor(email));
    if (!f.exists()) {
        return true;
    }
    if (!f.remove()) {
        outError.Set(ErrorKind::StorageUnwritable, QString("CredentialStore::Delete: %1").arg(f.errorString()));
        return false;
    }

    outDeleted = true;
    AuditLog::Event("CREDENTIAL_DELETE", QJsonObject{{"email", AuditLog::RedactEmail(NormalizeEmail(email))}});
    return true;
}

} // namespace gsuite::db
