// KeyMaterial.cpp

#include "KeyMaterial.h"

#include <QCryptographicHash>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStringList>

static QStringList keyFields(const QString& line)
{
    return line.trimmed().split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
}

static QString firstNonEmptyLine(const QString& text)
{
    const QStringList lines = text.split('\n');
    for (const QString& ln : lines) {
        const QString t = ln.trimmed();
        if (!t.isEmpty())
            return t;
    }
    return QString();
}

bool KeyMaterial::load(const QString& path, KeyMaterial* out, QString* err)
{
    if (err) err->clear();

    const QFileInfo fi(path);
    if (path.trimmed().isEmpty() || !fi.exists()) {
        if (err) *err = QStringLiteral("Public key file not found: %1").arg(path);
        return false;
    }
    if (!fi.isFile()) {
        if (err) *err = QStringLiteral("Public key path is not a regular file: %1").arg(path);
        return false;
    }

    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        if (err) *err = QStringLiteral("Cannot read public key %1: %2").arg(path, f.errorString());
        return false;
    }
    const QString text = QString::fromUtf8(f.readAll());
    f.close();

    const QString line = text.trimmed();
    if (line.isEmpty()) {
        if (err) *err = QStringLiteral("Public key file is empty: %1").arg(path);
        return false;
    }
    if (line.startsWith("-----BEGIN")) {
        if (err) *err = QStringLiteral("%1 looks like a private key; pass the .pub file instead.").arg(path);
        return false;
    }

    const QStringList parts = keyFields(firstNonEmptyLine(text));
    if (parts.size() < 2) {
        if (err) *err = QStringLiteral("Unrecognized public key format in %1").arg(path);
        return false;
    }

    KeyMaterial k;
    k.path = path;
    k.content = text;
    k.keyLine = line;
    k.keyType = parts.at(0);
    k.fingerprintToken = parts.at(1);
    k.comment = parts.mid(2).join(' ');

    if (out) *out = k;
    return true;
}

QString KeyMaterial::fingerprintTokenOf(const QString& keyContent)
{
    const QStringList parts = keyFields(firstNonEmptyLine(keyContent));
    return parts.size() >= 2 ? parts.at(1) : QString();
}

bool KeyMaterial::looksLikeOpenSshPubKey(const QString& line)
{
    const QString s = line.trimmed();
    return s.startsWith("ssh-ed25519 ") || s.startsWith("ssh-rsa ") ||
           s.startsWith("ecdsa-sha2-") || s.startsWith("sk-ssh-ed25519") ||
           s.startsWith("sk-ecdsa-sha2-") || s.startsWith("ssh-dss ");
}

bool KeyMaterial::hasLineBreaks() const
{
    return keyLine.contains('\n') || keyLine.contains('\r') || keyLine.contains(QChar(0));
}

QString KeyMaterial::privateKeyPath() const
{
    if (!path.endsWith(".pub"))
        return QString();
    const QString priv = path.left(path.size() - 4);
    return QFileInfo(priv).isFile() ? priv : QString();
}

QString KeyMaterial::sha256Fingerprint() const
{
    // Tolerate missing '=' padding
    QByteArray b64 = fingerprintToken.toLatin1();
    const int mod = b64.size() % 4;
    if (mod) b64.append(QByteArray(4 - mod, '='));

    const QByteArray blob = QByteArray::fromBase64(b64);
    if (blob.isEmpty())
        return QString();

    const QByteArray digest = QCryptographicHash::hash(blob, QCryptographicHash::Sha256);
    QString out = QString::fromLatin1(digest.toBase64());
    out.remove('=');
    return "SHA256:" + out;
}
