#include "core/storage/Schema.h"

#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>

#include "core/storage/Db.h"

namespace gsuite::core::storage {

Schema::Schema(Db& db)
    : db_(db)
{
}

bool Schema::Ensure(QString& outError)
{
    outError.clear();
    if (!db_.IsOpen()) {
        outError = "Schema::Ensure: db not open";
        return false;
    }

    if (!EnsureMeta(outError)) {
        return false;
    }

    const int version = CurrentVersion();
    if (version < 0) {
        outError = "Schema::Ensure: schema_version unreadable";
        return false;
    }
    if (version > kVersion) {
        outError = QString("Schema::Ensure: database schema v%1 is newer than supported v%2")
                       .arg(version)
                       .arg(kVersion);
        return false;
    }

    if (!EnsureTables(outError)) {
        return false;
    }

    if (version < kVersion) {
        return SetVersion(kVersion, outError);
    }
    return true;
}

bool Schema::EnsureMeta(QString& outError)
{
    QSqlQuery query(db_.Handle());

    if (!query.exec("CREATE TABLE IF NOT EXISTS app_meta (k TEXT PRIMARY KEY, v TEXT NOT NULL)")) {
        outError = QString("Schema::EnsureMeta: %1").arg(query.lastError().text());
        return false;
    }

    if (!query.exec("INSERT OR IGNORE INTO app_meta(k, v) VALUES('schema_version', '0')")) {
        outError = QString("Schema::EnsureMeta: %1").arg(query.lastError().text());
        return false;
    }

    return true;
}

bool Schema::EnsureTables(QString& outError)
{
    QSqlQuery query(db_.Handle());

    // id orders the registry: rows are listed in insertion order and an upsert of an
    // existing email keeps its id.
    if (!query.exec(
            "CREATE TABLE IF NOT EXISTS accounts ("
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  email TEXT NOT NULL UNIQUE,"
            "  account_type TEXT NOT NULL DEFAULT 'user',"
            "  extra_info TEXT NOT NULL DEFAULT '',"
            "  created_at_utc INTEGER NOT NULL,"
            "  updated_at_utc INTEGER NOT NULL"
            ")")) {
        outError = QString("Schema::EnsureTables: %1").arg(query.lastError().text());
        return false;
    }

    return true;
}

int Schema::CurrentVersion() const
{
    QSqlQuery query(db_.Handle());
    if (!query.exec("SELECT v FROM app_meta WHERE k='schema_version' LIMIT 1")) {
        return -1;
    }
    if (!query.next()) {
        return 0;
    }
    bool ok = false;
    const int version = query.value(0).toInt(&ok);
    return ok ? version : 0;
}

bool Schema::SetVersion(int version, QString& outError)
{
    QSqlQuery query(db_.Handle());
    query.prepare("UPDATE app_meta SET v=:v WHERE k='schema_version'");
    query.bindValue(":v", QString::number(version));
    if (!query.exec()) {
        outError = QString("Schema::SetVersion: %1").arg(query.lastError().text());
        return false;
    }
    if (query.numRowsAffected() <= 0) {
        outError = "Schema::SetVersion: schema_version row missing";
        return false;
    }
    return true;
}

} // namespace gsuite::core::storage
