#include "core/storage/Db.h"

#include <atomic>

#include <QDir>
#include <QFileInfo>
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>

namespace gsuite::core::storage {

static QString NextConnectionName()
{
    static std::atomic<int> counter{0};
    return QString("gsuite_accounts_%1").arg(counter.fetch_add(1));
}

Db::Db()
    : connectionName_(NextConnectionName())
{
    QSqlDatabase created = QSqlDatabase::addDatabase("QSQLITE", connectionName_);
    db_ = new QSqlDatabase(created);
}

Db::~Db()
{
    Close();
    delete db_;
    db_ = nullptr;
    // Every QSqlDatabase copy must be gone before the connection is removed.
    QSqlDatabase::removeDatabase(connectionName_);
}

bool Db::Open(const QString& path, QString& outError)
{
    outError.clear();
    if (db_ == nullptr || !db_->isValid()) {
        outError = "sqlite-driver-unavailable";
        return false;
    }
    if (path.trimmed().isEmpty()) {
        outError = "db-path-empty";
        return false;
    }

    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        outError = QString("db-dir-create-failed dir=%1").arg(info.absolutePath());
        return false;
    }

    Close();
    path_ = path;
    db_->setDatabaseName(path);
    open_ = db_->open();
    if (!open_) {
        outError = QString("db-open-failed err=%1").arg(db_->lastError().text());
        return false;
    }

    // Commit straight to disk; a crash after a write returns must not lose it.
    QSqlQuery pragma(*db_);
    if (!pragma.exec("PRAGMA synchronous=FULL")) {
        outError = QString("db-pragma-failed err=%1").arg(pragma.lastError().text());
        Close();
        return false;
    }
    return true;
}

void Db::Close()
{
    if (db_ != nullptr && db_->isOpen()) {
        db_->close();
    }
    open_ = false;
}

bool Db::IsOpen() const
{
    return db_ != nullptr && db_->isOpen() && open_;
}

QString Db::Path() const
{
    return path_;
}

QSqlDatabase& Db::Handle()
{
    return *db_;
}

} // namespace gsuite::core::storage
