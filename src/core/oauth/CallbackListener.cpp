#include "core/oauth/CallbackListener.h"

#include <algorithm>
#include <exception>
#include <memory>

#include <QByteArray>
#include <QHostAddress>
#include <QJsonObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QThread>
#include <QUrl>
#include <QUrlQuery>

#include "core/logging/AuditLog.h"

namespace gsuite::core::oauth {

using gsuite::auth::AuthError;
using gsuite::auth::ErrorKind;
using gsuite::core::logging::AuditLog;

namespace {

constexpr int kRequestReadTimeoutMs = 3000;
constexpr int kMaxRequestHeadBytes = 16 * 1024;

const QByteArray kPageSuccess =
    "<html><head><title>Authorization Successful</title></head><body>"
    "<h1>Authorization Successful!</h1>"
    "<p>You can close this window and return to the application.</p>"
    "</body></html>";

const QByteArray kPageProviderError =
    "<html><head><title>Authorization Failed</title></head><body>"
    "<h1>Authorization was not granted.</h1>"
    "<p>You can close this window and return to the application.</p>"
    "</body></html>";

const QByteArray kPageMissingCode =
    "<html><head><title>Bad Request</title></head><body>"
    "<h1>Missing authorization code.</h1>"
    "</body></html>";

const QByteArray kPageNotFound =
    "<html><head><title>Not Found</title></head><body><h1>Not Found</h1></body></html>";

struct ScopedWorker {
    explicit ScopedWorker(QThread* t)
        : thread(t)
    {
    }

    ~ScopedWorker()
    {
        if (thread) {
            thread->wait();
        }
    }

    ScopedWorker(const ScopedWorker&) = delete;
    ScopedWorker& operator=(const ScopedWorker&) = delete;

    std::unique_ptr<QThread> thread;
};

bool HeadComplete(const QByteArray& buf)
{
    return buf.contains("\r\n\r\n") || buf.contains("\n\n");
}

// Reads until the end of the request head. Returns false on timeout, peer close,
// oversize head or cancel. Never waits past the listener's own deadline.
bool ReadRequestHead(QTcpSocket& sock, QDeadlineTimer deadline, const std::atomic<bool>& cancelled, QByteArray& outHead)
{
    QDeadlineTimer readDeadline(kRequestReadTimeoutMs);
    if (!deadline.isForever() && deadline.deadline() < readDeadline.deadline()) {
        readDeadline = deadline;
    }
    outHead = sock.readAll();
    while (!HeadComplete(outHead)) {
        if (cancelled.load() || readDeadline.hasExpired() || outHead.size() > kMaxRequestHeadBytes) {
            return false;
        }
        const int slice = static_cast<int>(std::min<qint64>(CallbackListener::kPollSliceMs, readDeadline.remainingTime()));
        if (!sock.waitForReadyRead(std::max(slice, 1))) {
            if (sock.state() != QAbstractSocket::ConnectedState) {
                return false;
            }
            continue;
        }
        outHead += sock.readAll();
    }
    return true;
}

// "GET /path?query HTTP/1.1"
bool ParseRequestLine(const QByteArray& head, QByteArray& outMethod, QUrl& outTarget)
{
    const int eol = head.indexOf('\n');
    const QByteArray first = head.left(eol < 0 ? head.size() : eol).trimmed();
    const QList<QByteArray> parts = first.split(' ');
    if (parts.size() != 3 || !parts[2].startsWith("HTTP/")) {
        return false;
    }

    outMethod = parts[0];
    outTarget = QUrl(QString("http://localhost%1").arg(QString::fromLatin1(parts[1])));
    return outTarget.isValid() && parts[1].startsWith('/');
}

void Respond(QTcpSocket& sock, int status, const char* reason, const QByteArray& html)
{
    QByteArray resp = QByteArray("HTTP/1.1 ") + QByteArray::number(status) + " " + reason + "\r\n";
    resp += "Content-Type: text/html; charset=utf-8\r\n";
    resp += "Content-Length: " + QByteArray::number(html.size()) + "\r\n";
    resp += "Cache-Control: no-store\r\n";
    resp += "Connection: close\r\n\r\n";
    resp += html;

    sock.write(resp);
    while (sock.bytesToWrite() > 0 && sock.waitForBytesWritten(1000)) {
    }
    sock.disconnectFromHost();
    if (sock.state() != QAbstractSocket::UnconnectedState) {
        sock.waitForDisconnected(500);
    }
}

QString NormalizePath(const QString& path)
{
    return path.isEmpty() ? QString("/") : path;
}

struct Outcome {
    bool ok = false;
    CallbackResult result;
    AuthError error;
};

// Answers one browser connection. Returns true when the wait is over (code or
// provider error received); outcome is filled in that case.
bool HandleConnection(QTcpSocket& sock,
                      const QString& expectedPath,
                      QDeadlineTimer deadline,
                      const std::atomic<bool>& cancelled,
                      Outcome& outcome)
{
    QByteArray head;
    if (!ReadRequestHead(sock, deadline, cancelled, head)) {
        sock.abort();
        return false;
    }

    QByteArray method;
    QUrl target;
    if (!ParseRequestLine(head, method, target) || method != "GET") {
        Respond(sock, 400, "Bad Request", kPageMissingCode);
        return false;
    }
    if (NormalizePath(target.path()) != expectedPath) {
        Respond(sock, 404, "Not Found", kPageNotFound);
        return false;
    }

    const QUrlQuery query(target);
    const QString code = query.queryItemValue("code", QUrl::FullyDecoded);
    const QString state = query.queryItemValue("state", QUrl::FullyDecoded);
    const QString error = query.queryItemValue("error", QUrl::FullyDecoded);

    if (!error.isEmpty()) {
        Respond(sock, 200, "OK", kPageProviderError);
        outcome.error.Set(ErrorKind::ProviderError, error);
        return true;
    }
    if (code.isEmpty()) {
        Respond(sock, 400, "Bad Request", kPageMissingCode);
        return false;
    }

    Respond(sock, 200, "OK", kPageSuccess);
    outcome.ok = true;
    outcome.result.code = code;
    outcome.result.state = state;
    return true;
}

void Serve(quint16 port, const QString& expectedPath, QDeadlineTimer deadline, const std::atomic<bool>& cancelled, Outcome& outcome)
{
    // "localhost" may resolve to either loopback family, so both are served when the
    // host has IPv6.
    QTcpServer v4;
    v4.setMaxPendingConnections(1);
    if (!v4.listen(QHostAddress::LocalHost, port)) {
        outcome.error.Set(ErrorKind::PortUnavailable,
                          QString("listen 127.0.0.1:%1 failed: %2").arg(port).arg(v4.errorString()));
        return;
    }
    QTcpServer v6;
    v6.setMaxPendingConnections(1);
    if (!v6.listen(QHostAddress::LocalHostIPv6, port)) {
        if (v6.serverError() == QAbstractSocket::AddressInUseError) {
            outcome.error.Set(ErrorKind::PortUnavailable,
                              QString("listen [::1]:%1 failed: %2").arg(port).arg(v6.errorString()));
            return;
        }
        // No IPv6 loopback on this host; 127.0.0.1 alone serves the redirect.
    }

    QTcpServer* servers[] = {&v4, &v6};
    for (;;) {
        if (cancelled.load()) {
            outcome.error.Set(ErrorKind::Cancelled, "listener-cancelled");
            break;
        }
        if (deadline.hasExpired()) {
            outcome.error.Set(ErrorKind::Timeout, "no-redirect-before-deadline");
            break;
        }

        const qint64 remaining = deadline.isForever() ? CallbackListener::kPollSliceMs : deadline.remainingTime();
        int slice = static_cast<int>(std::min<qint64>(CallbackListener::kPollSliceMs, remaining));
        if (v6.isListening()) {
            slice /= 2;
        }

        bool done = false;
        for (QTcpServer* server : servers) {
            if (!server->isListening()) {
                continue;
            }
            bool timedOut = false;
            if (!server->waitForNewConnection(std::max(slice, 1), &timedOut)) {
                if (timedOut) {
                    continue;
                }
                outcome.error.Set(ErrorKind::NetworkError, QString("accept-failed: %1").arg(server->errorString()));
                done = true;
                break;
            }

            std::unique_ptr<QTcpSocket> sock(server->nextPendingConnection());
            if (sock && HandleConnection(*sock, expectedPath, deadline, cancelled, outcome)) {
                done = true;
                break;
            }
        }
        if (done) {
            break;
        }
    }

    v4.close();
    v6.close();
}

} // namespace

void CallbackListener::Cancel()
{
    cancelled_.store(true);
}

bool CallbackListener::IsCancelled() const
{
    return cancelled_.load();
}

bool CallbackListener::AwaitRedirect(quint16 port,
                                     const QString& path,
                                     QDeadlineTimer deadline,
                                     CallbackResult& out,
                                     AuthError& outError)
{
    outError.Clear();
    out = {};

    if (port == 0) {
        outError.Set(ErrorKind::InvalidArgument, "callback port must be fixed");
        return false;
    }

    const QString expectedPath = NormalizePath(path);
    Outcome outcome;

    {
        ScopedWorker worker(QThread::create([&]() {
            try {
                Serve(port, expectedPath, deadline, cancelled_, outcome);
            } catch (const std::exception& e) {
                outcome.ok = false;
                outcome.error.Set(ErrorKind::NetworkError, QString("listener-exception: %1").arg(e.what()));
            }
        }));
        worker.thread->start();
    }

    if (!outcome.ok) {
        outError = outcome.error;
        AuditLog::Event("OAUTH_CALLBACK",
                        QJsonObject{{"port", static_cast<int>(port)},
                                    {"outcome", QString::fromLatin1(gsuite::auth::ErrorKindName(outError.kind))}});
        return false;
    }

    out = outcome.result;
    AuditLog::Event("OAUTH_CALLBACK", QJsonObject{{"port", static_cast<int>(port)}, {"outcome", "code-received"}});
    return true;
}

} // namespace gsuite::core::oauth
