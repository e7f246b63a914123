#include "db/AccountRegistry.hpp"

#include <QDateTime>
#include <QJsonObject>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>

#include "core/logging/AuditLog.h"
#include "core/storage/Schema.h"
#include "db/Email.hpp"

namespace gsuite::db {

using gsuite::auth::AuthError;
using gsuite::auth::ErrorKind;
using gsuite::core::logging::AuditLog;

static qint64 NowUtcSeconds()
{
    return QDateTime::currentDateTimeUtc().toSecsSinceEpoch();
}

static Account RowToAccount(const QSqlQuery& q)
{
    Account a;
    a.email = q.value(0).toString();
    a.accountType = q.value(1).toString();
    a.extraInfo = q.value(2).toString();
    a.createdAtUtc = q.value(3).toLongLong();
    a.updatedAtUtc = q.value(4).toLongLong();
    return a;
}

bool AccountRegistry::Open(const QString& dbPath, AuthError& outError)
{
    outError.Clear();

    QString err;
    if (!db_.Open(dbPath, err)) {
        outError.Set(ErrorKind::StorageUnwritable, QString("AccountRegistry::Open: %1").arg(err));
        return false;
    }

    gsuite::core::storage::Schema schema(db_);
    if (!schema.Ensure(err)) {
        db_.Close();
        outError.Set(ErrorKind::StorageCorrupt, err);
        return false;
    }
    return true;
}

bool AccountRegistry::IsOpen() const
{
    return db_.IsOpen();
}

bool AccountRegistry::RequireOpen(const char* op, AuthError& outError) const
{
    if (db_.IsOpen()) {
        return true;
    }
    outError.Set(ErrorKind::StorageUnwritable, QString("AccountRegistry::%1: registry not open").arg(op));
    return false;
}

bool AccountRegistry::List(QVector<Account>& outAccounts, AuthError& outError)
{
    outError.Clear();
    outAccounts.clear();
    if (!RequireOpen("List", outError)) {
        return false;
    }

    QSqlQuery q(db_.Handle());
    if (!q.exec("SELECT email, account_type, extra_info, created_at_utc, updated_at_utc "
                "FROM accounts ORDER BY id ASC")) {
        outError.Set(ErrorKind::StorageCorrupt, QString("AccountRegistry::List: %1").arg(q.lastError().text()));
        return false;
    }

    while (q.next()) {
        outAccounts.push_back(RowToAccount(q));
    }
    return true;
}

bool AccountRegistry::Get(const QString& email, std::optional<Account>& outAccount, AuthError& outError)
{
    outError.Clear();
    outAccount.reset();
    if (!RequireOpen("Get", outError)) {
        return false;
    }

    const QString key = NormalizeEmail(email);
    if (key.isEmpty()) {
        outError.Set(ErrorKind::InvalidArgument, "AccountRegistry::Get: email required");
        return false;
    }

    QSqlQuery q(db_.Handle());
    q.prepare("SELECT email, account_type, extra_info, created_at_utc, updated_at_utc "
              "FROM accounts WHERE email = :email LIMIT 1");
    q.bindValue(":email", key);
    if (!q.exec()) {
        outError.Set(ErrorKind::StorageCorrupt, QString("AccountRegistry::Get: %1").arg(q.lastError().text()));
        return false;
    }

    if (q.next()) {
        outAccount = RowToAccount(q);
    }
    return true;
}

bool AccountRegistry::Upsert(const Account& account, AuthError& outError)
{
    outError.Clear();
    if (!RequireOpen("Upsert", outError)) {
        return false;
    }

    const QString key = NormalizeEmail(account.email);
    if (!LooksLikeEmail(key)) {
        outError.Set(ErrorKind::InvalidArgument, "AccountRegistry::Upsert: valid email required");
        return false;
    }

    const qint64 now = NowUtcSeconds();

    // SQLite UPSERT; DO UPDATE keeps the row id and therefore the list position.
    QSqlQuery q(db_.Handle());
    q.prepare(
        "INSERT INTO accounts(email, account_type, extra_info, created_at_utc, updated_at_utc) "
        "VALUES(:email, :account_type, :extra_info, :created_at_utc, :updated_at_utc) "
        "ON CONFLICT(email) DO UPDATE SET "
        "  account_type = excluded.account_type, "
        "  extra_info = excluded.extra_info, "
        "  updated_at_utc = excluded.updated_at_utc");
    q.bindValue(":email", key);
    q.bindValue(":account_type", account.accountType.trimmed().isEmpty() ? QString("user") : account.accountType.trimmed());
    q.bindValue(":extra_info", account.extraInfo);
    q.bindValue(":created_at_utc", now);
    q.bindValue(":updated_at_utc", now);

    if (!q.exec()) {
        outError.Set(ErrorKind::StorageUnwritable, QString("AccountRegistry::Upsert: %1").arg(q.lastError().text()));
        return false;
    }

    AuditLog::Event("ACCOUNT_UPSERT", QJsonObject{{"email", AuditLog::RedactEmail(key)}});
    return true;
}

bool AccountRegistry::Remove(const QString& email, bool& outRemoved, AuthError& outError)
{
    outError.Clear();
    outRemoved = false;
    if (!RequireOpen("Remove", outError)) {
        return false;
    }

    const QString key = NormalizeEmail(email);
    if (key.isEmpty()) {
        outError.Set(ErrorKind::InvalidArgument, "AccountRegistry::Remove: email required");
        return false;
    }

    QSqlQuery q(db_.Handle());
    q.prepare("DELETE FROM accounts WHERE email = :email");
    q.bindValue(":email", key);
    if (!q.exec()) {
        outError.Set(ErrorKind::StorageUnwritable, QString("AccountRegistry::Remove: %1").arg(q.lastError().text()));
        return false;
    }

    outRemoved = q.numRowsAffected() > 0;
    if (outRemoved) {
        AuditLog::Event("ACCOUNT_REMOVE", QJsonObject{{"email", AuditLog::RedactEmail(key)}});
    }
    return true;
}

} // namespace gsuite::db
