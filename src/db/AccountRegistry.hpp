#pragma once

#include <optional>

#include <QString>
#include <QVector>

#include "auth/AuthError.hpp"
#include "core/storage/Db.h"

namespace gsuite::db {

struct Account {
    QString email;                // normalized
    QString accountType = "user";
    QString extraInfo;
    qint64 createdAtUtc = 0;      // unix seconds; set by the registry
    qint64 updatedAtUtc = 0;
};

// Durable email -> metadata mapping. Holds no secret material.
// Every call returns false only on failure; "not found" is a successful lookup.
class AccountRegistry {
public:
    AccountRegistry() = default;

    AccountRegistry(const AccountRegistry&) = delete;
    AccountRegistry& operator=(const AccountRegistry&) = delete;

    bool Open(const QString& dbPath, gsuite::auth::AuthError& outError);
    bool IsOpen() const;

    // Insertion order, stable across reloads.
    bool List(QVector<Account>& outAccounts, gsuite::auth::AuthError& outError);

    bool Get(const QString& email, std::optional<Account>& outAccount, gsuite::auth::AuthError& outError);

    // Insert or replace by email. Replacing keeps the original position and created_at.
    bool Upsert(const Account& account, gsuite::auth::AuthError& outError);

    // outRemoved is false when no such account existed.
    bool Remove(const QString& email, bool& outRemoved, gsuite::auth::AuthError& outError);

private:
    bool RequireOpen(const char* op, gsuite::auth::AuthError& outError) const;

    gsuite::core::storage::Db db_;
};

} // namespace gsuite::db
