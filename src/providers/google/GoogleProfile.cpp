#include "providers/google/GoogleProfile.hpp"

namespace gsuite::providers::google {

OAuthEndpoints GoogleProfile::OAuth() const
{
    OAuthEndpoints endpoints;
    endpoints.authorizeUrl = "https://accounts.google.com/o/oauth2/v2/auth";
    endpoints.tokenUrl = "https://oauth2.googleapis.com/token";
    return endpoints;
}

QStringList GoogleProfile::Scopes() const
{
    return {
        "openid",
        "https://www.googleapis.com/auth/userinfo.email",
        "https://mail.google.com/",
        "https://www.googleapis.com/auth/analytics.readonly",
    };
}

QString GoogleProfile::DefaultRedirectUri() const { return "http://localhost:8080/"; }
int GoogleProfile::DefaultCallbackPort() const { return 8080; }

} // namespace gsuite::providers::google
