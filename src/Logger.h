#pragma once
#include <QString>

// Process-wide Qt message handler.
//
// Console: "[INFO] ...", "[WARN] ...", "[ERROR] ..." (coloured on a TTY),
//          INFO/DEBUG on stdout, WARN/ERROR on stderr.
// File:    optional; "timestamp [LEVEL] file:line func - message", rotated
//          at 2 MiB keeping 3 old files.
namespace Logger {
    void install(const QString& appName);

    // 0=Errors only, 1=Normal, 2=Debug
    void setLogLevel(int level);
    int  logLevel();

    // Empty => console only
    void setLogFilePath(const QString& absoluteFilePath);
    QString logFilePath();

    void setColorEnabled(bool enabled);
}
