#pragma once

#include <atomic>
#include <mutex>
#include <string>

#include <QJsonObject>
#include <QString>

namespace gsuite::core::logging {

// Append-only JSONL event log. Every line is {"ts":..,"event":..,"payload":{..}}.
// Until Init() is called all events are dropped.
// Callers must never pass token material in a payload.
class AuditLog {
public:
    static void Init(const std::string& auditPath);
    static void Close();
    static std::string Path();

    static void Event(const std::string& event, const std::string& payloadJson);
    static void Event(const std::string& event, const QJsonObject& payload);

    // Convenience helpers
    static void AppStart(const std::string& accountsDbPath);
    static void AppExit(int exitCode);

    // "jane.doe@example.com" -> "j***@example.com"
    static QString RedactEmail(const QString& email);

private:
    static std::string s_path;
    static std::mutex s_mu;

    // Ensures APP_EXIT is written once per process.
    static std::atomic<bool> s_appExitWritten;

    static void WriteLineLocked(const std::string& line);
    static std::string NowIsoUtc();
    static std::string EscapeJson(const std::string& s);
};

} // namespace gsuite::core::logging
