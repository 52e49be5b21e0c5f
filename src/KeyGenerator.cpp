// KeyGenerator.cpp

#include "KeyGenerator.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QProcess>

#include <sodium.h>

#include "OpenSshEd25519Key.h"

// ---------------------------------------------------------------------------
// libsodium must be initialized once per process; sodium_init() is
// idempotent but we avoid calling it on every key.
// ---------------------------------------------------------------------------
static bool sodiumInitOnce(QString* errOut)
{
    static bool inited = false;
    if (inited) return true;

    if (sodium_init() < 0) {
        if (errOut) *errOut = QStringLiteral("libsodium init failed (sodium_init).");
        return false;
    }
    inited = true;
    return true;
}

static bool writeKeyFile(const QString& path, const QByteArray& data,
                         QFileDevice::Permissions perms, QString* errOut)
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (errOut) *errOut = QString("Failed to write %1: %2").arg(path, f.errorString());
        return false;
    }
    // Restrict before any key bytes land in the file
    if (!f.setPermissions(perms)) {
        if (errOut) *errOut = QString("Failed to set permissions on %1: %2").arg(path, f.errorString());
        f.close();
        QFile::remove(path);
        return false;
    }
    if (f.write(data) != data.size()) {
        if (errOut) *errOut = QString("Failed to write %1: %2").arg(path, f.errorString());
        f.close();
        QFile::remove(path);
        return false;
    }
    f.close();
    return true;
}

bool ensureKeyDir(const QString& keyPath, QString* err)
{
    const QString dirPath = QFileInfo(keyPath).absolutePath();
    QDir d(dirPath);
    if (d.exists()) return true;

    if (!d.mkpath(".")) {
        if (err) *err = QString("Failed to create key directory: %1").arg(dirPath);
        return false;
    }
    QFile::setPermissions(dirPath, QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
    return true;
}

// ===========================================================================
// ssh-keygen
// ===========================================================================

SshKeygenGenerator::SshKeygenGenerator(const QString& binary)
    : m_binary(binary.trimmed().isEmpty() ? QStringLiteral("ssh-keygen") : binary.trimmed())
{
}

bool SshKeygenGenerator::generate(const QString& privPath, const QString& comment, QString* err)
{
    if (err) err->clear();
    if (!ensureKeyDir(privPath, err)) return false;

    QFile::remove(privPath);
    QFile::remove(privPath + ".pub");

    QStringList args;
    args << "-t" << "ed25519" << "-f" << privPath;
    if (!comment.isEmpty()) args << "-C" << comment;

    qDebug().noquote() << QString("[KEYGEN] %1 -t ed25519 -f %2").arg(m_binary, privPath);

    // Passphrase prompts go straight to the terminal
    QProcess p;
    p.setProcessChannelMode(QProcess::ForwardedChannels);
    p.setInputChannelMode(QProcess::ForwardedInputChannel);
    p.start(m_binary, args);
    if (!p.waitForStarted()) {
        if (err) *err = QString("Failed to start %1: %2").arg(m_binary, p.errorString());
        return false;
    }
    if (!p.waitForFinished(-1)) {
        if (err) *err = QString("%1 did not finish: %2").arg(m_binary, p.errorString());
        return false;
    }
    if (p.exitStatus() != QProcess::NormalExit || p.exitCode() != 0) {
        if (err) *err = QString("%1 failed (exit %2).").arg(m_binary).arg(p.exitCode());
        return false;
    }
    if (!QFileInfo::exists(privPath + ".pub")) {
        if (err) *err = QString("%1 did not produce %2.pub").arg(m_binary, privPath);
        return false;
    }
    return true;
}

// ===========================================================================
// libsodium
// ===========================================================================

bool SodiumKeyGenerator::generate(const QString& privPath, const QString& comment, QString* err)
{
    if (err) err->clear();
    if (!sodiumInitOnce(err)) return false;
    if (!ensureKeyDir(privPath, err)) return false;

    unsigned char pk[crypto_sign_PUBLICKEYBYTES];
    unsigned char sk[crypto_sign_SECRETKEYBYTES];
    if (crypto_sign_keypair(pk, sk) != 0) {
        if (err) *err = QStringLiteral("crypto_sign_keypair failed.");
        return false;
    }

    const QByteArray pub32(reinterpret_cast<const char*>(pk), crypto_sign_PUBLICKEYBYTES);
    QByteArray priv64(reinterpret_cast<const char*>(sk), crypto_sign_SECRETKEYBYTES);
    sodium_memzero(sk, sizeof(sk));

    QByteArray privFile = OpenSshEd25519Key::privateKeyFile(pub32, priv64, comment, randombytes_random());
    sodium_memzero(priv64.data(), size_t(priv64.size()));

    const QByteArray pubLine = OpenSshEd25519Key::publicKeyLine(pub32, comment).toUtf8() + "\n";

    QFile::remove(privPath);
    QFile::remove(privPath + ".pub");

    const bool ok =
        writeKeyFile(privPath, privFile, QFileDevice::ReadOwner | QFileDevice::WriteOwner, err) &&
        writeKeyFile(privPath + ".pub", pubLine,
                     QFileDevice::ReadOwner | QFileDevice::WriteOwner |
                     QFileDevice::ReadGroup | QFileDevice::ReadOther, err);

    sodium_memzero(privFile.data(), size_t(privFile.size()));

    if (!ok) {
        QFile::remove(privPath);
        return false;
    }

    qDebug().noquote() << QString("[KEYGEN] sodium ed25519 written to %1").arg(privPath);
    return true;
}
