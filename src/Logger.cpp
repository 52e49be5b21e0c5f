// Logger.cpp
#include "Logger.h"

#include <QAtomicInt>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>

#include <cstdio>     // fprintf
#include <cstdlib>    // abort
#include <unistd.h>   // isatty

#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
#include <QStringConverter>
#endif

// =====================================================
// Global logger state (process-wide)
// =====================================================

static QFile*     g_file  = nullptr;   // Optional log file
static QMutex     g_mutex;             // Guards writes and g_file
static QString    g_path;              // Absolute path to log file (empty => none)
static QString    g_appName;
static QAtomicInt g_level(1);          // 0=Errors only, 1=Normal, 2=Debug
static QAtomicInt g_color(-1);         // -1 = auto (isatty)

// Prevent recursion if something inside handler triggers Qt logging again
static thread_local bool g_inHandler = false;

// =====================================================
// Log level mapping
// =====================================================

static QString levelToString(QtMsgType t)
{
    switch (t) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "FATAL";
    }
    return "LOG";
}

static const char* levelColor(QtMsgType t)
{
    switch (t) {
        case QtDebugMsg:    return "\033[0;36m";
        case QtInfoMsg:     return "\033[0;32m";
        case QtWarningMsg:  return "\033[1;33m";
        case QtCriticalMsg:
        case QtFatalMsg:    return "\033[0;31m";
    }
    return "";
}

//
// 0 = Errors only: WARN/ERROR/FATAL
// 1 = Normal:      INFO/WARN/ERROR/FATAL
// 2 = Debug:       everything
//
static bool allowMessage(QtMsgType type)
{
    const int lvl = g_level.loadAcquire();

    if (lvl <= 0)
        return (type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg);
    if (lvl == 1)
        return type != QtDebugMsg;
    return true;
}

// One record = one physical line
static QString normalizeMessage(QString s)
{
    s.replace("\r\n", "\n");
    s.replace('\r', '\n');
    s.replace('\n', ' ');
    s.replace('\t', ' ');
    return s.simplified();
}

static bool useColor(FILE* stream)
{
    const int c = g_color.loadAcquire();
    if (c >= 0) return c != 0;
    return isatty(fileno(stream)) != 0;
}

static void writeConsole(QtMsgType type, const QString& msg)
{
    const bool toErr = (type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg);
    FILE* stream = toErr ? stderr : stdout;

    const QByteArray tag = levelToString(type).toLatin1();
    const QByteArray text = msg.toUtf8();

    if (useColor(stream))
        std::fprintf(stream, "%s[%s]\033[0m %s\n", levelColor(type), tag.constData(), text.constData());
    else
        std::fprintf(stream, "[%s] %s\n", tag.constData(), text.constData());
    std::fflush(stream);
}

// =====================================================
// Qt message handler
// =====================================================
static void handler(QtMsgType type,
                    const QMessageLogContext& ctx,
                    const QString& msg)
{
    if (!allowMessage(type)) {
        if (type == QtFatalMsg) abort(); // never suppress fatal
        return;
    }

    if (g_inHandler) {
        if (type == QtFatalMsg) abort();
        return;
    }
    g_inHandler = true;

    {
        QMutexLocker lock(&g_mutex);

        const QString cleanMsg = normalizeMessage(msg);
        writeConsole(type, cleanMsg);

        if (g_file && g_file->isOpen()) {
            const QString ts  = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
            const QString where =
                (ctx.file && ctx.function)
                    ? QString("%1:%2 %3")
                          .arg(QFileInfo(QString::fromUtf8(ctx.file)).fileName())
                          .arg(ctx.line)
                          .arg(ctx.function)
                    : QString();

            QTextStream out(g_file);
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
            out.setEncoding(QStringConverter::Utf8);
#else
            out.setCodec("UTF-8");
#endif
            out << ts << " [" << levelToString(type) << "] ";
            if (!where.isEmpty())
                out << where << " - ";
            out << cleanMsg << "\n";
            out.flush();
        }

        if (type == QtFatalMsg)
            abort();
    }

    g_inHandler = false;
}

// =====================================================
// Log rotation (size-based)
// =====================================================

static void rotateIfNeeded(const QString& path,
                           qint64 maxBytes = 2 * 1024 * 1024,
                           int keep = 3)
{
    QFileInfo fi(path);
    if (!fi.exists() || fi.size() < maxBytes)
        return;

    // .2 -> .3, .1 -> .2, log -> .1 ; the oldest is dropped
    QFile::remove(path + "." + QString::number(keep));
    for (int i = keep - 1; i >= 1; --i) {
        const QString older = path + "." + QString::number(i);
        if (QFileInfo::exists(older))
            QFile::rename(older, path + "." + QString::number(i + 1));
    }

    QFile::rename(path, path + ".1");
}

static void closeFileLocked()
{
    if (g_file) {
        if (g_file->isOpen()) g_file->close();
        delete g_file;
        g_file = nullptr;
    }
}

// =====================================================
// Public Logger API
// =====================================================

namespace Logger {

void install(const QString& appName)
{
    {
        QMutexLocker lock(&g_mutex);
        g_appName = appName;
    }
    qInstallMessageHandler(handler);
}

void setLogFilePath(const QString& absoluteFilePath)
{
    const QString path = absoluteFilePath.trimmed().isEmpty()
                             ? QString()
                             : QDir::cleanPath(absoluteFilePath.trimmed());

    QString failed;
    {
        QMutexLocker lock(&g_mutex);
        closeFileLocked();
        g_path.clear();

        if (path.isEmpty())
            return;

        QDir().mkpath(QFileInfo(path).absolutePath());
        rotateIfNeeded(path);

        g_file = new QFile(path);
        if (g_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            g_path = path;
        } else {
            failed = g_file->errorString();
            closeFileLocked();
        }
    }

    if (!failed.isEmpty()) {
        qWarning().noquote() << QString("Cannot open log file %1: %2").arg(path, failed);
        return;
    }
    qDebug().noquote() << QString("%1 logging to %2").arg(g_appName, path);
}

QString logFilePath()
{
    QMutexLocker lock(&g_mutex);
    return g_path;
}

// 0=Errors only, 1=Normal, 2=Debug
void setLogLevel(int level)
{
    if (level < 0) level = 0;
    if (level > 2) level = 2;
    g_level.storeRelease(level);
}

int logLevel()
{
    return g_level.loadAcquire();
}

void setColorEnabled(bool enabled)
{
    g_color.storeRelease(enabled ? 1 : 0);
}

} // namespace Logger
