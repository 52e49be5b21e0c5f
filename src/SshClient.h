// SshClient.h
//
// Purpose:
//   RemoteExec implementation on top of libssh:
//     - Connect + authenticate (agent, public key, then password /
//       keyboard-interactive unless in batch mode)
//     - known_hosts verification with an injected confirmation callback
//     - Remote exec over a fresh channel per command, capturing
//       stdout/stderr and the exit status
//
// The session is kept open between run() calls for the same target and
// mode, so the presence check and the registration share one login.

#pragma once

#include <QString>
#include <functional>
#include <memory>

#include "RemoteExec.h"

// Forward-declare libssh session type to avoid pulling libssh headers into the header.
struct ssh_session_struct;
using ssh_session = ssh_session_struct*;
struct ssh_callbacks_struct;

class SshClient : public RemoteExec
{
public:
    SshClient();
    ~SshClient() override;

    SshClient(const SshClient&) = delete;
    SshClient& operator=(const SshClient&) = delete;

    // Asked for passwords and keyboard-interactive answers.
    // - prompt: server- or client-provided text
    // - echo:   whether the answer may be shown while typing
    // - ok:     set false if the user cancelled
    // Never log the returned text.
    using SecretProvider = std::function<QString(const QString& prompt, bool echo, bool* ok)>;

    // Asked when the server's host key is not in known_hosts yet.
    using HostKeyConfirm = std::function<bool(const QString& host, const QString& fingerprint)>;

    void setSecretProvider(SecretProvider cb) { m_secretProvider = std::move(cb); }
    void setHostKeyConfirm(HostKeyConfirm cb) { m_hostKeyConfirm = std::move(cb); }

    bool connectTarget(const Target& target, const ExecOptions& opts, QString* err = nullptr);

    // Close/free current libssh session (safe to call multiple times).
    void disconnect();

    bool isConnected() const;

    // Execute a command on the current session.
    // Returns false on channel errors or timeout; the remote exit status is
    // reported through result. timeoutMs <= 0 means "no timeout".
    bool exec(const QString& command, RemoteResult* result, QString* err = nullptr, int timeoutMs = 0);

    bool run(const Target& target,
             const QString& command,
             const ExecOptions& opts,
             RemoteResult* result,
             QString* err = nullptr) override;

    QString name() const override { return QStringLiteral("libssh"); }

private:
    bool verifyHostKey(ssh_session s, const Target& target, bool batchMode, QString* err);
    bool authenticate(ssh_session s, const Target& target, bool batchMode, QString* err);

    static QString sessionKey(const Target& target, const ExecOptions& opts);

    // Active libssh session.
    ssh_session m_session = nullptr;
    QString     m_sessionKey;

    // Must outlive the session it is registered on.
    std::unique_ptr<ssh_callbacks_struct> m_callbacks;

    SecretProvider m_secretProvider;
    HostKeyConfirm m_hostKeyConfirm;
};
