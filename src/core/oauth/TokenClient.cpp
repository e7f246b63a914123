#include "core/oauth/TokenClient.h"

#include <QEventLoop>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>

namespace gsuite::core::oauth {

HttpTokenClient::HttpTokenClient(int timeoutSeconds)
    : timeoutSeconds_(timeoutSeconds > 0 ? timeoutSeconds : 30)
{
}

bool HttpTokenClient::PostForm(const QUrl& endpoint, const QUrlQuery& form, TokenResponse& out, QString& outError)
{
    outError.clear();
    out = TokenResponse{};

    QNetworkAccessManager nam;
    QNetworkRequest req(endpoint);
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/x-www-form-urlencoded");
    req.setRawHeader("Accept", "application/json");
    req.setTransferTimeout(timeoutSeconds_ * 1000);

    const QByteArray body = form.query(QUrl::FullyEncoded).toUtf8();
    QNetworkReply* reply = nam.post(req, body);

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) {
        loop.exec();
    }

    const QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    const QNetworkReply::NetworkError netErr = reply->error();
    const QString netErrText = reply->errorString();
    const QByteArray raw = reply->readAll();
    reply->deleteLater();

    if (!statusAttr.isValid()) {
        outError = QString("token-http-no-response err=%1").arg(netErrText);
        return false;
    }
    out.httpStatus = statusAttr.toInt();

    QJsonParseError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(raw, &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        outError = QString("token-json-parse-failed http=%1 err=%2 net=%3")
                       .arg(out.httpStatus)
                       .arg(pe.errorString())
                       .arg(static_cast<int>(netErr));
        return false;
    }

    out.json = doc.object();
    return true;
}

} // namespace gsuite::core::oauth
