#pragma once

#include <QJsonObject>
#include <QString>

// Append-only JSONL record of what ssh-keyreg did to which host.
//   <AppLocalData>/audit/audit-YYYY-MM-DD.jsonl   (or the override dir)
// One object per line: ts, event, app, version, pid, session_id + fields.
// Callers pass fingerprints, never key bodies or secrets.
namespace AuditLogger {
    void install(const QString& appName);

    void setEnabled(bool enabled);
    bool isEnabled();

    void setSessionId(const QString& sessionId);
    QString sessionId();

    // Empty => default directory
    void setAuditDirOverride(const QString& absoluteDirPath);
    QString auditDir();
    QString currentLogFilePath();

    void writeEvent(const QString& eventName, const QJsonObject& fields = QJsonObject());
}
