// AuditLogger.cpp
#include "AuditLogger.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>

// =====================================================
// Global audit logger state (process-wide)
// =====================================================
//
// One mutex guards everything below. The file handle is kept open for the
// current day and reopened when the day or the directory changes.
// Write failures drop the event silently.

static QMutex   g_auditMutex;
static QString  g_appName;
static QString  g_sessionId;
static QString  g_auditDirOverride;
static bool     g_enabled = true;

static QFile*   g_auditFile = nullptr;
static QString  g_openPath;

static QString dayKey()
{
    return QDateTime::currentDateTime().toString("yyyy-MM-dd");
}

static QString auditDirLocked()
{
    const QString ov = g_auditDirOverride.trimmed();
    if (!ov.isEmpty())
        return QDir::cleanPath(ov);
    return QDir::cleanPath(QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + "/audit");
}

static QString todaysPathLocked()
{
    return QDir(auditDirLocked()).filePath(QString("audit-%1.jsonl").arg(dayKey()));
}

static void closeLocked()
{
    if (g_auditFile) {
        if (g_auditFile->isOpen())
            g_auditFile->close();
        delete g_auditFile;
        g_auditFile = nullptr;
    }
    g_openPath.clear();
}

static bool ensureOpenLocked()
{
    const QString want = todaysPathLocked();
    if (g_auditFile && g_auditFile->isOpen() && g_openPath == want)
        return true;

    closeLocked();
    QDir().mkpath(auditDirLocked());

    g_auditFile = new QFile(want);
    if (!g_auditFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        closeLocked();
        return false;
    }
    // Host names and fingerprints only, but still nobody else's business
    g_auditFile->setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    g_openPath = want;
    return true;
}

namespace AuditLogger {

void install(const QString& appName)
{
    // No qInfo/qWarning here: the Logger may not be installed yet.
    QMutexLocker lock(&g_auditMutex);
    g_appName = appName;
}

void setEnabled(bool enabled)
{
    QMutexLocker lock(&g_auditMutex);
    g_enabled = enabled;
    if (!enabled)
        closeLocked();
}

bool isEnabled()
{
    QMutexLocker lock(&g_auditMutex);
    return g_enabled;
}

void setSessionId(const QString& sessionId)
{
    QMutexLocker lock(&g_auditMutex);
    g_sessionId = sessionId;
}

QString sessionId()
{
    QMutexLocker lock(&g_auditMutex);
    return g_sessionId;
}

void setAuditDirOverride(const QString& absoluteDirPath)
{
    QMutexLocker lock(&g_auditMutex);
    const QString v = absoluteDirPath.trimmed().isEmpty()
                          ? QString()
                          : QDir::cleanPath(absoluteDirPath.trimmed());
    if (v == g_auditDirOverride)
        return;
    g_auditDirOverride = v;
    closeLocked();
}

QString auditDir()
{
    QMutexLocker lock(&g_auditMutex);
    return auditDirLocked();
}

QString currentLogFilePath()
{
    QMutexLocker lock(&g_auditMutex);
    return g_openPath.isEmpty() ? todaysPathLocked() : g_openPath;
}

void writeEvent(const QString& eventName, const QJsonObject& fields)
{
    QMutexLocker lock(&g_auditMutex);

    if (!g_enabled || !ensureOpenLocked())
        return;

    QJsonObject o;
    o.insert("ts", QDateTime::currentDateTime().toString(Qt::ISODateWithMs));
    o.insert("event", eventName);
    o.insert("app", g_appName.isEmpty() ? QCoreApplication::applicationName() : g_appName);
    o.insert("version", QCoreApplication::applicationVersion());
    o.insert("pid", static_cast<qint64>(QCoreApplication::applicationPid()));
    if (!g_sessionId.isEmpty())
        o.insert("session_id", g_sessionId);

    for (auto it = fields.begin(); it != fields.end(); ++it)
        o.insert(it.key(), it.value());

    g_auditFile->write(QJsonDocument(o).toJson(QJsonDocument::Compact) + "\n");
    g_auditFile->flush();
}

} // namespace AuditLogger
