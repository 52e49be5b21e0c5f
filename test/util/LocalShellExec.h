// LocalShellExec.h
//
// Test RemoteExec: runs each "remote" command with /bin/sh on this machine,
// with HOME pointed at a private QTemporaryDir. The registration scripts
// therefore run for real against a throwaway ~/.ssh.

#pragma once

#include <QStringList>
#include <QTemporaryDir>
#include <QVector>

#include "RemoteExec.h"

class LocalShellExec : public RemoteExec
{
public:
    struct Call {
        QString     command;
        ExecOptions opts;
    };

    LocalShellExec();

    bool run(const Target& target,
             const QString& command,
             const ExecOptions& opts,
             RemoteResult* result,
             QString* err = nullptr) override;

    QString name() const override { return QStringLiteral("local-sh"); }

    bool isValid() const { return m_home.isValid(); }

    QString home() const { return m_home.path(); }
    QString sshDir() const { return m_home.path() + "/.ssh"; }
    QString authorizedKeysPath() const { return sshDir() + "/authorized_keys"; }

    // Batch-mode runs fail like an unreachable host
    void setFailBatchRuns(bool fail) { m_failBatch = fail; }

    // Installs a PATH entry whose `name` always exits 1
    bool breakCommand(const QString& name);

    // authorized_keys helpers
    bool writeAuthorizedKeys(const QByteArray& text);
    QByteArray readAuthorizedKeys() const;
    QStringList authorizedKeyLines() const;

    const QVector<Call>& calls() const { return m_calls; }

private:
    QTemporaryDir m_home;
    QTemporaryDir m_binDir;
    bool          m_hasBrokenCommands = false;
    bool          m_failBatch = false;
    QVector<Call> m_calls;
};
