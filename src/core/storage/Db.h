#pragma once

#include <QString>

class QSqlDatabase;

namespace gsuite::core::storage {

// One SQLite connection. Every instance registers its own named Qt connection so
// several registries (e.g. one per test) can coexist in a process.
class Db {
public:
    Db();
    ~Db();

    Db(const Db&) = delete;
    Db& operator=(const Db&) = delete;

    bool Open(const QString& path, QString& outError);
    void Close();
    bool IsOpen() const;
    QString Path() const;
    QSqlDatabase& Handle();

private:
    QString connectionName_;
    QString path_;
    QSqlDatabase* db_ = nullptr;
    bool open_ = false;
};

} // namespace gsuite::core::storage
