#pragma once

#include <QString>

namespace gsuite::core::storage {

class Db;

class Schema {
public:
    explicit Schema(Db& db);

    // Creates/migrates the registry tables. Returns false and sets outError on failure.
    bool Ensure(QString& outError);

    static constexpr int kVersion = 1;

private:
    bool EnsureMeta(QString& outError);
    bool EnsureTables(QString& outError);
    int CurrentVersion() const;
    bool SetVersion(int version, QString& outError);

    Db& db_;
};

} // namespace gsuite::core::storage
