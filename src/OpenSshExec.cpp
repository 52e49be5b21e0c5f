// OpenSshExec.cpp
//
// Spawns `ssh [-p PORT] [-o ...] target command` per call.
// ssh exits 255 on its own errors (connect, auth, host key), anything else
// is the remote command's exit status.

#include "OpenSshExec.h"

#include <QDebug>
#include <QProcess>

static constexpr int kSshOwnErrorExit = 255;

OpenSshExec::OpenSshExec(const QString& sshBinary)
    : m_sshBinary(sshBinary.trimmed().isEmpty() ? QStringLiteral("ssh") : sshBinary.trimmed())
{
}

QStringList OpenSshExec::buildArgs(const Target& target,
                                   const QString& command,
                                   const ExecOptions& opts)
{
    QStringList args;

    if (target.port != 22)
        args << "-p" << QString::number(target.port);

    if (opts.batchMode) {
        args << "-o" << "BatchMode=yes"
             << "-o" << "NumberOfPasswordPrompts=0"
             << "-o" << "ConnectionAttempts=1";
    }
    if (opts.connectTimeoutSec > 0)
        args << "-o" << QString("ConnectTimeout=%1").arg(opts.connectTimeoutSec);

    if (!opts.identityFile.isEmpty())
        args << "-i" << opts.identityFile;

    args << target.userHost << command;
    return args;
}

bool OpenSshExec::run(const Target& target,
                      const QString& command,
                      const ExecOptions& opts,
                      RemoteResult* result,
                      QString* err)
{
    if (err) err->clear();
    if (result) *result = RemoteResult();

    const QStringList args = buildArgs(target, command, opts);

    qDebug().noquote() << QString("[SSH] %1 %2 (batch=%3)")
                          .arg(m_sshBinary, target.display())
                          .arg(opts.batchMode ? "yes" : "no");

    QProcess p;
    if (opts.batchMode) {
        p.setProcessChannelMode(QProcess::SeparateChannels);
        p.setInputChannelMode(QProcess::ManagedInputChannel);
    } else {
        // Password / host-key prompts must reach the user
        p.setProcessChannelMode(QProcess::ForwardedErrorChannel);
        p.setInputChannelMode(QProcess::ForwardedInputChannel);
    }

    p.start(m_sshBinary, args);
    if (!p.waitForStarted()) {
        if (err) *err = QString("Failed to start %1: %2").arg(m_sshBinary, p.errorString());
        return false;
    }
    if (opts.batchMode)
        p.closeWriteChannel();

    // Interactive runs wait for the user; batch runs get a hard ceiling.
    const int waitMs = opts.batchMode
                           ? ((opts.connectTimeoutSec > 0 ? opts.connectTimeoutSec : 10) + 30) * 1000
                           : -1;

    if (!p.waitForFinished(waitMs)) {
        p.kill();
        p.waitForFinished(2000);
        if (err) *err = QString("%1 did not finish in time.").arg(m_sshBinary);
        return false;
    }

    const QString outText = QString::fromUtf8(p.readAllStandardOutput());
    const QString errText = QString::fromUtf8(p.readAllStandardError()).trimmed();

    if (p.exitStatus() != QProcess::NormalExit) {
        if (err) *err = QString("%1 terminated abnormally.").arg(m_sshBinary);
        return false;
    }

    if (p.exitCode() == kSshOwnErrorExit) {
        if (err) {
            *err = errText.isEmpty()
                ? QString("%1 could not connect to %2.").arg(m_sshBinary, target.display())
                : QString("%1: %2").arg(m_sshBinary, errText);
        }
        return false;
    }

    if (result) {
        result->exitStatus = p.exitCode();
        result->out = outText;
        result->err = errText;
    }

    qDebug().noquote() << QString("[SSH] exit=%1 stdoutLen=%2").arg(p.exitCode()).arg(outText.size());
    return true;
}
