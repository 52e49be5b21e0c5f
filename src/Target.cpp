#include "Target.h"

#include <QRegularExpression>

bool Target::parse(const QString& text, int port, Target* out, QString* err)
{
    if (err) err->clear();

    const QString s = text.trimmed();
    if (s.isEmpty()) {
        if (err) *err = QStringLiteral("No remote host specified.");
        return false;
    }
    if (s.contains(QRegularExpression("\\s"))) {
        if (err) *err = QStringLiteral("Target '%1' must not contain whitespace.").arg(s);
        return false;
    }
    if (s.startsWith('-')) {
        if (err) *err = QStringLiteral("Target '%1' looks like an option.").arg(s);
        return false;
    }

    // Parse user@host (user optional)
    QString user;
    QString host = s;
    const int atPos = s.indexOf('@');
    if (atPos >= 0) {
        user = s.left(atPos);
        host = s.mid(atPos + 1);
        if (user.isEmpty()) {
            if (err) *err = QStringLiteral("Empty user name in '%1'.").arg(s);
            return false;
        }
    }

    if (host.isEmpty()) {
        if (err) *err = QStringLiteral("No host specified in '%1'.").arg(s);
        return false;
    }
    if (host.startsWith('-')) {
        if (err) *err = QStringLiteral("Host '%1' looks like an option.").arg(host);
        return false;
    }
    if (port < 1 || port > 65535) {
        if (err) *err = QStringLiteral("Invalid port %1 (expected 1-65535).").arg(port);
        return false;
    }

    if (out) {
        out->userHost = s;
        out->user = user;
        out->host = host;
        out->port = port;
    }
    return true;
}

QString Target::display() const
{
    if (port == 22)
        return userHost;
    return QString("%1:%2").arg(userHost).arg(port);
}
