#include "core/logging/AuditLog.h"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <QCoreApplication>
#include <QDateTime>
#include <QJsonDocument>

namespace gsuite::core::logging {

std::string AuditLog::s_path;
std::mutex AuditLog::s_mu;
std::atomic<bool> AuditLog::s_appExitWritten{false};

void AuditLog::Init(const std::string& auditPath)
{
    std::lock_guard<std::mutex> lk(s_mu);
    s_path = auditPath;
    if (s_path.empty()) {
        return;
    }

    const std::filesystem::path parent = std::filesystem::path(s_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            s_path.clear();
        }
    }
}

void AuditLog::Close()
{
    std::lock_guard<std::mutex> lk(s_mu);
    s_path.clear();
}

std::string AuditLog::Path()
{
    std::lock_guard<std::mutex> lk(s_mu);
    return s_path;
}

void AuditLog::AppStart(const std::string& accountsDbPath)
{
    QJsonObject payload;
    payload.insert("component", "app");
    payload.insert("accounts_db", QString::fromStdString(accountsDbPath));
    payload.insert("pid", static_cast<qint64>(QCoreApplication::applicationPid()));
    Event("APP_START", payload);
}

void AuditLog::AppExit(int exitCode)
{
    // Only the first APP_EXIT of a process is written.
    bool expected = false;
    if (!s_appExitWritten.compare_exchange_strong(expected, true)) {
        return;
    }

    QJsonObject payload;
    payload.insert("component", "app");
    payload.insert("exit_code", exitCode);
    Event("APP_EXIT", payload);
}

void AuditLog::Event(const std::string& event, const std::string& payloadJson)
{
    std::lock_guard<std::mutex> lk(s_mu);
    if (s_path.empty()) return;

    std::ostringstream line;
    line << "{\"ts\":\"" << NowIsoUtc() << "\",\"event\":\"" << EscapeJson(event)
         << "\",\"payload\":" << (payloadJson.empty() ? std::string("{}") : payloadJson) << "}\n";
    WriteLineLocked(line.str());
}

void AuditLog::Event(const std::string& event, const QJsonObject& payload)
{
    Event(event, QJsonDocument(payload).toJson(QJsonDocument::Compact).toStdString());
}

QString AuditLog::RedactEmail(const QString& email)
{
    const QString trimmed = email.trimmed();
    const int at = trimmed.indexOf('@');
    if (at > 0 && at < trimmed.size() - 1) {
        return QString("%1***@%2").arg(trimmed.left(1), trimmed.mid(at + 1));
    }
    if (trimmed.isEmpty()) {
        return "";
    }
    return QString("%1***").arg(trimmed.left(1));
}

void AuditLog::WriteLineLocked(const std::string& line)
{
    std::ofstream f(s_path, std::ios::app | std::ios::binary);
    f << line;
}

std::string AuditLog::NowIsoUtc()
{
    return QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString();
}

std::string AuditLog::EscapeJson(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '"':  out += "\\\""; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:   out += c; break;
        }
    }
    return out;
}

} // namespace gsuite::core::logging
