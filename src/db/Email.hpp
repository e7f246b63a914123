#pragma once

#include <QString>

namespace gsuite::db {

// Registry and credential records are keyed by the trimmed, lower-cased address.
inline QString NormalizeEmail(const QString& email)
{
    return email.trimmed().toLower();
}

inline bool LooksLikeEmail(const QString& email)
{
    const QString e = email.trimmed();
    const int at = e.indexOf('@');
    return at > 0 && at == e.lastIndexOf('@') && at < e.size() - 1 && !e.contains(' ')
        && !e.contains('/') && !e.contains('\\');
}

} // namespace gsuite::db
