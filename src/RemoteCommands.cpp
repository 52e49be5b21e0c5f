// RemoteCommands.cpp

#include "RemoteCommands.h"

#include <QStringList>

namespace RemoteCommands {

QString shQuote(const QString& s)
{
    QString out = s;
    out.replace("'", "'\"'\"'");
    return "'" + out + "'";
}

QString wrapSh(const QString& script)
{
    return "sh -c " + shQuote(script);
}

QString presenceCheck(const QString& fingerprintToken)
{
    return wrapSh(QString("grep -q -F -e %1 \"$HOME/.ssh/authorized_keys\" 2>/dev/null")
                      .arg(shQuote(fingerprintToken)));
}

QString registerKey(const QString& keyLine)
{
    QStringList s;
    s << "umask 077"
      << "d=\"$HOME/.ssh\""
      << "f=\"$d/authorized_keys\""
      << "t=\"$f.tmp.$$\""
      << "mkdir -p \"$d\" || exit 1"
      << "chmod 700 \"$d\" || exit 1"
      // Keep the last existing entry on its own line
      << "if [ -s \"$f\" ] && [ -n \"$(tail -c 1 \"$f\")\" ]; then printf '\\n' >> \"$f\" || exit 1; fi"
      << QString("printf '%s\\n' %1 >> \"$f\" || exit 1").arg(shQuote(keyLine))
      << "chmod 600 \"$f\" || exit 1"
      << "if LC_ALL=C sort -u \"$f\" > \"$t\" && chmod 600 \"$t\" && mv -f \"$t\" \"$f\"; then exit 0; fi"
      << "rm -f \"$t\""
      << "exit 1";
    return wrapSh(s.join("; "));
}

QString verifyBanner()
{
    return QStringLiteral("ssh-keyreg: connection OK");
}

QString verifyEcho()
{
    return "echo " + shQuote(verifyBanner());
}

} // namespace RemoteCommands
