#pragma once

#include <QString>
#include <QStringList>

namespace gsuite::providers::google {

struct OAuthEndpoints {
    QString authorizeUrl;
    QString tokenUrl;
};

class GoogleProfile {
public:
    OAuthEndpoints OAuth() const;

    // Statically configured scope set requested for every account.
    QStringList Scopes() const;

    // Fixed loopback redirect the Google console client is registered with.
    QString DefaultRedirectUri() const;
    int DefaultCallbackPort() const;
};

} // namespace gsuite::providers::google
