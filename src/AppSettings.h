// AppSettings.h
//
// Persistent defaults, read from QSettings:
//   ~/.config/ssh-keyreg/ssh-keyreg.conf   (INI on Linux)
//
//   [remote]  backend=openssh|libssh, connectTimeoutSec=5, sshBinary=ssh
//   [keys]    defaultPublicKey=~/.ssh/id_rsa.pub, generator=ssh-keygen|sodium,
//             generatedKeyPath=~/.ssh/id_ed25519
//   [copyId]  enabled=true
//   [logging] level=0..2, filePath=
//   [audit]   enabled=true, dirPath=
//
// Command-line flags override these values.

#pragma once

#include <QString>

class QSettings;

struct AppSettings {
    QString backend           = QStringLiteral("openssh");
    int     connectTimeoutSec = 5;
    QString sshBinary         = QStringLiteral("ssh");

    QString defaultPublicKey;   // ~/.ssh/id_rsa.pub
    QString generator         = QStringLiteral("ssh-keygen");
    QString generatedKeyPath;   // ~/.ssh/id_ed25519

    bool    copyIdEnabled     = true;

    int     logLevel          = 1;  // 0=Errors only, 1=Normal, 2=Debug
    QString logFilePath;

    bool    auditEnabled      = true;
    QString auditDirPath;

    static AppSettings defaults();

    // Missing keys keep their defaults; invalid values are replaced by
    // defaults with a warning.
    static AppSettings load(QSettings& s);
    static AppSettings load();
};

// "~" and "~/x" -> home directory based paths; everything else unchanged.
QString expandHomePath(const QString& path);
