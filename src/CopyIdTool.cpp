#include "CopyIdTool.h"

#include <QDebug>
#include <QProcess>
#include <QStandardPaths>

SshCopyIdTool::SshCopyIdTool(const QString& binary)
    : m_binary(binary)
{
}

bool SshCopyIdTool::isAvailable() const
{
    return !QStandardPaths::findExecutable(m_binary).isEmpty();
}

bool SshCopyIdTool::copy(const Target& target, const KeyMaterial& key, QString* err)
{
    if (err) err->clear();

    const QString exe = QStandardPaths::findExecutable(m_binary);
    if (exe.isEmpty()) {
        if (err) *err = QString("%1 not found in PATH.").arg(m_binary);
        return false;
    }

    const QStringList args{ "-i", key.path, "-p", QString::number(target.port), target.userHost };
    qDebug().noquote() << QString("[COPY-ID] %1 %2").arg(exe, args.join(' '));

    // ssh-copy-id talks to the user (password, host key), so forward everything
    QProcess p;
    p.setProcessChannelMode(QProcess::ForwardedChannels);
    p.setInputChannelMode(QProcess::ForwardedInputChannel);
    p.start(exe, args);
    if (!p.waitForStarted()) {
        if (err) *err = QString("Failed to start %1: %2").arg(exe, p.errorString());
        return false;
    }
    if (!p.waitForFinished(-1)) {
        if (err) *err = QString("%1 did not finish: %2").arg(exe, p.errorString());
        return false;
    }
    if (p.exitStatus() != QProcess::NormalExit || p.exitCode() != 0) {
        if (err) *err = QString("%1 exited with status %2.").arg(m_binary).arg(p.exitCode());
        return false;
    }
    return true;
}
