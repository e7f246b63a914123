#pragma once

#include <QJsonObject>
#include <QString>
#include <QUrl>
#include <QUrlQuery>

namespace gsuite::core::oauth {

struct TokenResponse {
    int httpStatus = 0;
    QJsonObject json;
};

// Transport for the provider's token endpoint. PostForm returns false only when no
// HTTP answer was obtained (connect failure, timeout, body not JSON); an HTTP error
// status with a JSON body is a successful round trip for the caller to interpret.
class TokenClient {
public:
    virtual ~TokenClient() = default;
    virtual bool PostForm(const QUrl& endpoint, const QUrlQuery& form, TokenResponse& out, QString& outError) = 0;
};

// QNetworkAccessManager-backed client. Blocks the calling thread on a local event loop;
// needs a QCoreApplication.
class HttpTokenClient final : public TokenClient {
public:
    explicit HttpTokenClient(int timeoutSeconds = 30);
    bool PostForm(const QUrl& endpoint, const QUrlQuery& form, TokenResponse& out, QString& outError) override;

private:
    int timeoutSeconds_;
};

} // namespace gsuite::core::oauth
