// AppSettings.cpp

#include "AppSettings.h"

#include <QDebug>
#include <QDir>
#include <QSettings>

QString expandHomePath(const QString& path)
{
    const QString p = path.trimmed();
    if (p == "~")
        return QDir::homePath();
    if (p.startsWith("~/"))
        return QDir::homePath() + p.mid(1);
    return p;
}

AppSettings AppSettings::defaults()
{
    AppSettings a;
    a.defaultPublicKey = QDir(QDir::homePath()).filePath(".ssh/id_rsa.pub");
    a.generatedKeyPath = QDir(QDir::homePath()).filePath(".ssh/id_ed25519");
    return a;
}

AppSettings AppSettings::load(QSettings& s)
{
    AppSettings a = defaults();

    const QString backend = s.value("remote/backend", a.backend).toString().trimmed().toLower();
    if (backend == "openssh" || backend == "libssh") {
        a.backend = backend;
    } else {
        qWarning().noquote() << QString("Ignoring unknown remote/backend '%1'").arg(backend);
    }

    bool ok = false;
    const int timeout = s.value("remote/connectTimeoutSec", a.connectTimeoutSec).toInt(&ok);
    if (ok && timeout > 0) {
        a.connectTimeoutSec = timeout;
    } else {
        qWarning().noquote() << "Ignoring invalid remote/connectTimeoutSec";
    }

    const QString sshBinary = s.value("remote/sshBinary", a.sshBinary).toString().trimmed();
    if (!sshBinary.isEmpty()) a.sshBinary = sshBinary;

    const QString pub = s.value("keys/defaultPublicKey").toString();
    if (!pub.trimmed().isEmpty()) a.defaultPublicKey = expandHomePath(pub);

    const QString gen = s.value("keys/generator", a.generator).toString().trimmed().toLower();
    if (gen == "ssh-keygen" || gen == "sodium") {
        a.generator = gen;
    } else {
        qWarning().noquote() << QString("Ignoring unknown keys/generator '%1'").arg(gen);
    }

    const QString genPath = s.value("keys/generatedKeyPath").toString();
    if (!genPath.trimmed().isEmpty()) a.generatedKeyPath = expandHomePath(genPath);

    a.copyIdEnabled = s.value("copyId/enabled", a.copyIdEnabled).toBool();

    int lvl = s.value("logging/level", a.logLevel).toInt();
    if (lvl < 0) lvl = 0;
    if (lvl > 2) lvl = 2;
    a.logLevel = lvl;
    a.logFilePath = expandHomePath(s.value("logging/filePath", QString()).toString());

    a.auditEnabled = s.value("audit/enabled", a.auditEnabled).toBool();
    a.auditDirPath = expandHomePath(s.value("audit/dirPath", QString()).toString());

    return a;
}

AppSettings AppSettings::load()
{
    QSettings s;
    return load(s);
}
