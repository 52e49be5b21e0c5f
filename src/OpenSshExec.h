// OpenSshExec.h
//
// RemoteExec backed by the OpenSSH client binary.
//
// Interactive runs forward stdin/stderr to the terminal so ssh can ask for
// a password or a host key confirmation; batch runs capture everything and
// pass BatchMode=yes / ConnectTimeout.

#pragma once

#include <QStringList>

#include "RemoteExec.h"

class OpenSshExec : public RemoteExec
{
public:
    explicit OpenSshExec(const QString& sshBinary = QStringLiteral("ssh"));

    bool run(const Target& target,
             const QString& command,
             const ExecOptions& opts,
             RemoteResult* result,
             QString* err = nullptr) override;

    QString name() const override { return QStringLiteral("openssh"); }

    // Argument vector passed to ssh (exposed for logging and tests).
    static QStringList buildArgs(const Target& target,
                                 const QString& command,
                                 const ExecOptions& opts);

private:
    QString m_sshBinary;
};
