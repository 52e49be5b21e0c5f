// SshClient.cpp
//
// Purpose:
//   libssh transport for ssh-keyreg.
//   - Creates and owns a libssh session
//   - Verifies the server against ~/.ssh/known_hosts
//   - Authenticates with agent/public key; in interactive mode falls back
//     to password and keyboard-interactive through the SecretProvider
//   - Runs remote commands over a fresh channel and reports exit status
//
// Notes:
//   - ~/.ssh/config is honoured (ssh_options_parse_config) but the port and
//     user from the command line win.
//   - Never log secrets (passwords, passphrases, answers).

#include "SshClient.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QFile>

#include <libssh/libssh.h>
#include <libssh/callbacks.h>

#include <algorithm>
#include <cstring>
#include <memory>

static constexpr int kMaxPasswordAttempts = 3;

// ------------------------------------------------------------
// Small helper to turn libssh's last error into QString
// ------------------------------------------------------------
static QString libsshError(ssh_session s)
{
    if (!s) return QStringLiteral("libssh: null session");
    return QString::fromLocal8Bit(ssh_get_error(s));
}

// Copies a secret into a libssh-provided buffer (NUL terminated).
static int copySecret(const QString& secret, char* buf, size_t len)
{
    if (len == 0) return SSH_AUTH_DENIED;
    QByteArray utf8 = secret.toUtf8();
    const size_t n = std::min(len - 1, static_cast<size_t>(utf8.size()));
    std::memcpy(buf, utf8.constData(), n);
    buf[n] = '\0';
    utf8.fill('\0');
    return SSH_AUTH_SUCCESS;
}

SshClient::SshClient() = default;

SshClient::~SshClient()
{
    disconnect();
}

QString SshClient::sessionKey(const Target& target, const ExecOptions& opts)
{
    return QString("%1|%2|%3|%4")
        .arg(target.userHost)
        .arg(target.port)
        .arg(opts.batchMode ? 1 : 0)
        .arg(opts.identityFile);
}

// ------------------------------------------------------------
// Host key check against known_hosts.
// Unknown hosts are accepted only interactively and only if confirmed;
// a changed key is always fatal.
// ------------------------------------------------------------
bool SshClient::verifyHostKey(ssh_session s, const Target& target, bool batchMode, QString* err)
{
    ssh_key srvKey = nullptr;
    if (ssh_get_server_publickey(s, &srvKey) != SSH_OK) {
        if (err) *err = "Cannot read server host key: " + libsshError(s);
        return false;
    }

    unsigned char* hash = nullptr;
    size_t hlen = 0;
    const int hrc = ssh_get_publickey_hash(srvKey, SSH_PUBLICKEY_HASH_SHA256, &hash, &hlen);
    ssh_key_free(srvKey);
    if (hrc != 0) {
        if (err) *err = "Cannot hash server host key.";
        return false;
    }

    char* fpC = ssh_get_fingerprint_hash(SSH_PUBLICKEY_HASH_SHA256, hash, hlen);
    const QString fingerprint = fpC ? QString::fromLatin1(fpC) : QString();
    if (fpC) ssh_string_free_char(fpC);
    ssh_clean_pubkey_hash(&hash);

    const enum ssh_known_hosts_e state = ssh_session_is_known_server(s);
    switch (state) {
    case SSH_KNOWN_HOSTS_OK:
        qDebug().noquote() << QString("[SSH] host key OK %1").arg(fingerprint);
        return true;

    case SSH_KNOWN_HOSTS_CHANGED:
    case SSH_KNOWN_HOSTS_OTHER:
        if (err) *err = QString("Host key for %1 does not match known_hosts (%2). "
                                "Possible man-in-the-middle attack; refusing to connect.")
                            .arg(target.host, fingerprint);
        return false;

    case SSH_KNOWN_HOSTS_NOT_FOUND:
    case SSH_KNOWN_HOSTS_UNKNOWN:
        break;

    case SSH_KNOWN_HOSTS_ERROR:
    default:
        if (err) *err = "known_hosts check failed: " + libsshError(s);
        return false;
    }

    if (batchMode || !m_hostKeyConfirm) {
        if (err) *err = QString("Host %1 is not in known_hosts (%2).").arg(target.host, fingerprint);
        return false;
    }

    if (!m_hostKeyConfirm(target.host, fingerprint)) {
        if (err) *err = QString("Host key for %1 was not accepted.").arg(target.host);
        return false;
    }

    if (ssh_session_update_known_hosts(s) != SSH_OK) {
        qWarning().noquote() << QString("[SSH] could not update known_hosts: %1").arg(libsshError(s));
    }
    return true;
}

// ------------------------------------------------------------
// Authentication strategy:
//   agent -> publickey_auto -> (interactive only) password /
//   keyboard-interactive, as offered by the server.
// ------------------------------------------------------------
bool SshClient::authenticate(ssh_session s, const Target& target, bool batchMode, QString* err)
{
    int rc = ssh_userauth_none(s, nullptr);
    if (rc == SSH_AUTH_SUCCESS) return true;
    if (rc == SSH_AUTH_ERROR) {
        if (err) *err = "Authentication failed: " + libsshError(s);
        return false;
    }

    const int methods = ssh_userauth_list(s, nullptr);

    if (methods & SSH_AUTH_METHOD_PUBLICKEY) {
        rc = ssh_userauth_agent(s, nullptr);
        if (rc == SSH_AUTH_SUCCESS) {
            qDebug().noquote() << QString("[SSH] auth OK via agent host='%1'").arg(target.host);
            return true;
        }

        rc = ssh_userauth_publickey_auto(s, nullptr, nullptr);
        if (rc == SSH_AUTH_SUCCESS) {
            qDebug().noquote() << QString("[SSH] auth OK via publickey host='%1'").arg(target.host);
            return true;
        }
    }

    if (batchMode || !m_secretProvider) {
        if (err) *err = "Public-key authentication failed: " + libsshError(s);
        return false;
    }

    if (methods & SSH_AUTH_METHOD_INTERACTIVE) {
        rc = ssh_userauth_kbdint(s, nullptr, nullptr);
        while (rc == SSH_AUTH_INFO) {
            const int n = ssh_userauth_kbdint_getnprompts(s);
            for (int i = 0; i < n; ++i) {
                char echo = 0;
                const char* prompt = ssh_userauth_kbdint_getprompt(s, i, &echo);
                bool ok = false;
                QString answer = m_secretProvider(QString::fromUtf8(prompt ? prompt : ""), echo != 0, &ok);
                if (!ok) {
                    if (err) *err = QStringLiteral("Authentication cancelled.");
                    return false;
                }
                const QByteArray utf8 = answer.toUtf8();
                answer.fill(QChar('\0'));
                if (ssh_userauth_kbdint_setanswer(s, i, utf8.constData()) < 0) {
                    if (err) *err = "Keyboard-interactive answer rejected: " + libsshError(s);
                    return false;
                }
            }
            rc = ssh_userauth_kbdint(s, nullptr, nullptr);
        }
        if (rc == SSH_AUTH_SUCCESS) {
            qDebug().noquote() << QString("[SSH] auth OK via keyboard-interactive host='%1'").arg(target.host);
            return true;
        }
    }

    if (methods & SSH_AUTH_METHOD_PASSWORD) {
        const QString who = target.user.isEmpty() ? target.host : target.userHost;
        for (int attempt = 0; attempt < kMaxPasswordAttempts; ++attempt) {
            bool ok = false;
            QString pw = m_secretProvider(QString("%1's password: ").arg(who), false, &ok);
            if (!ok) {
                if (err) *err = QStringLiteral("Authentication cancelled.");
                return false;
            }
            const QByteArray utf8 = pw.toUtf8();
            pw.fill(QChar('\0'));

            rc = ssh_userauth_password(s, nullptr, utf8.constData());
            if (rc == SSH_AUTH_SUCCESS) {
                qDebug().noquote() << QString("[SSH] auth OK via password host='%1'").arg(target.host);
                return true;
            }
            if (rc == SSH_AUTH_ERROR) break;
            qWarning().noquote() << "Permission denied, please try again.";
        }
    }

    if (err) *err = "Authentication failed: " + libsshError(s);
    return false;
}

bool SshClient::connectTarget(const Target& target, const ExecOptions& opts, QString* err)
{
    if (err) err->clear();

    if (target.host.trimmed().isEmpty()) {
        if (err) *err = QStringLiteral("No host specified.");
        return false;
    }

    // Always clean up any previous libssh session before reconnecting.
    disconnect();

    ssh_session s = ssh_new();
    if (!s) {
        if (err) *err = QStringLiteral("ssh_new() failed.");
        return false;
    }

    auto failAndFree = [&](const QString& msg) -> bool {
        if (err) *err = msg;
        qDebug().noquote() << QString("[SSH] connect FAILED host='%1': %2").arg(target.host, msg);
        ssh_disconnect(s);
        ssh_free(s);
        return false;
    };

    auto optSet = [&](enum ssh_options_e opt, const void* val, const char* what) -> bool {
        if (ssh_options_set(s, opt, val) != SSH_OK) {
            qWarning().noquote() << QString("[SSH] ssh_options_set(%1) failed: %2")
                                    .arg(QString::fromLatin1(what), libsshError(s));
            return false;
        }
        return true;
    };

    const QByteArray host = target.host.toUtf8();
    if (!optSet(SSH_OPTIONS_HOST, host.constData(), "HOST"))
        return failAndFree("Invalid host: " + libsshError(s));

    // ~/.ssh/config first, explicit values below override it
    if (ssh_options_parse_config(s, nullptr) != SSH_OK) {
        qDebug().noquote() << QString("[SSH] ssh config not applied: %1").arg(libsshError(s));
    }

    if (!target.user.isEmpty()) {
        const QByteArray user = target.user.toUtf8();
        optSet(SSH_OPTIONS_USER, user.constData(), "USER");
    }

    const unsigned int port = static_cast<unsigned int>(target.port);
    optSet(SSH_OPTIONS_PORT, &port, "PORT");

    if (opts.connectTimeoutSec > 0) {
        const long timeoutSec = opts.connectTimeoutSec;
        optSet(SSH_OPTIONS_TIMEOUT, &timeoutSec, "TIMEOUT");
    }

    if (!opts.identityFile.isEmpty()) {
        const QByteArray id = QFile::encodeName(opts.identityFile);
        optSet(SSH_OPTIONS_IDENTITY, id.constData(), "IDENTITY");
    }

    // Passphrase callback for encrypted private keys (interactive only)
    auto cb = std::make_unique<ssh_callbacks_struct>();
    std::memset(cb.get(), 0, sizeof(ssh_callbacks_struct));
    cb->userdata = this;
    cb->auth_function = [](const char* prompt, char* buf, size_t len,
                           int echo, int verify, void* userdata) -> int {
        Q_UNUSED(verify);
        auto* self = static_cast<SshClient*>(userdata);
        if (!self || !self->m_secretProvider) return SSH_AUTH_DENIED;

        bool ok = false;
        const QString pass = self->m_secretProvider(QString::fromUtf8(prompt ? prompt : ""), echo != 0, &ok);
        if (!ok) return SSH_AUTH_DENIED;
        return copySecret(pass, buf, len);
    };
    ssh_callbacks_init(cb.get());
    if (!opts.batchMode)
        ssh_set_callbacks(s, cb.get());

    qDebug().noquote() << QString("[SSH] connecting %1 (batch=%2)")
                          .arg(target.display(), opts.batchMode ? "yes" : "no");

    if (ssh_connect(s) != SSH_OK)
        return failAndFree(QString("ssh_connect to %1 failed: %2").arg(target.display(), libsshError(s)));

    QString e;
    if (!verifyHostKey(s, target, opts.batchMode, &e))
        return failAndFree(e);

    if (!authenticate(s, target, opts.batchMode, &e))
        return failAndFree(e);

    // Success: keep session (and the callbacks it points to)
    m_session = s;
    m_callbacks = std::move(cb);
    m_sessionKey = sessionKey(target, opts);

    qDebug().noquote() << QString("[SSH] connected %1").arg(target.display());
    return true;
}

// ------------------------------------------------------------
// Disconnect and free session (safe to call multiple times).
// ------------------------------------------------------------
void SshClient::disconnect()
{
    if (m_session) {
        qDebug().noquote() << "[SSH] disconnect";
        ssh_disconnect(m_session);
        ssh_free(m_session);
        m_session = nullptr;
    }
    m_callbacks.reset();
    m_sessionKey.clear();
}

bool SshClient::isConnected() const
{
    return m_session != nullptr;
}

// ------------------------------------------------------------
// Execute a remote command and capture stdout/stderr + exit status.
// ------------------------------------------------------------
bool SshClient::exec(const QString& command, RemoteResult* result, QString* err, int timeoutMs)
{
    if (result) *result = RemoteResult();
    if (err) err->clear();

    if (!m_session) {
        if (err) *err = "Not connected.";
        return false;
    }

    ssh_channel ch = ssh_channel_new(m_session);
    if (!ch) {
        if (err) *err = "ssh_channel_new failed.";
        return false;
    }

    auto cleanup = [&]() {
        if (ssh_channel_is_open(ch)) {
            ssh_channel_send_eof(ch);
            ssh_channel_close(ch);
        }
        ssh_channel_free(ch);
        ch = nullptr;
    };

    auto fail = [&](const QString& msg) -> bool {
        if (err) *err = msg;
        cleanup();
        return false;
    };

    if (ssh_channel_open_session(ch) != SSH_OK)
        return fail("ssh_channel_open_session failed: " + libsshError(m_session));

    if (ssh_channel_request_exec(ch, command.toUtf8().constData()) != SSH_OK)
        return fail("ssh_channel_request_exec failed: " + libsshError(m_session));

    QByteArray outBuf, errBuf;
    char buf[4096];

    QElapsedTimer timer;
    timer.start();

    auto readAvailable = [&](int isStderr) -> bool {
        while (true) {
            const int n = ssh_channel_read_nonblocking(ch, buf, sizeof(buf), isStderr);
            if (n == SSH_ERROR)
                return false;
            if (n <= 0)
                break;

            if (isStderr) errBuf.append(buf, n);
            else          outBuf.append(buf, n);
        }
        return true;
    };

    while (true) {
        if (timeoutMs > 0 && timer.elapsed() > timeoutMs)
            return fail(QString("Remote command timed out after %1 ms.").arg(timeoutMs));

        // Wait up to 50ms for stdout activity (main tick)
        const int availOut = ssh_channel_poll_timeout(ch, 50, 0);
        if (availOut == SSH_ERROR)
            return fail("ssh_channel_poll_timeout(stdout) failed: " + libsshError(m_session));
        if (availOut > 0 && !readAvailable(0))
            return fail("ssh_channel_read(stdout) failed: " + libsshError(m_session));

        const int availErr = ssh_channel_poll_timeout(ch, 0, 1);
        if (availErr == SSH_ERROR)
            return fail("ssh_channel_poll_timeout(stderr) failed: " + libsshError(m_session));
        if (availErr > 0 && !readAvailable(1))
            return fail("ssh_channel_read(stderr) failed: " + libsshError(m_session));

        // Stop when remote EOF and nothing more buffered
        if (ssh_channel_is_eof(ch)) {
            if (!readAvailable(0) || !readAvailable(1))
                return fail("ssh_channel_read(drain) failed: " + libsshError(m_session));
            break;
        }
    }

    ssh_channel_send_eof(ch);
    ssh_channel_close(ch);

    const int status = ssh_channel_get_exit_status(ch);
    ssh_channel_free(ch);
    ch = nullptr;

    if (result) {
        result->exitStatus = status;
        result->out = QString::fromUtf8(outBuf);
        result->err = QString::fromUtf8(errBuf).trimmed();
    }

    qDebug().noquote() << QString("[SSH] exec exit=%1 stdoutLen=%2").arg(status).arg(outBuf.size());
    return true;
}

bool SshClient::run(const Target& target,
                    const QString& command,
                    const ExecOptions& opts,
                    RemoteResult* result,
                    QString* err)
{
    if (err) err->clear();

    if (!m_session || m_sessionKey != sessionKey(target, opts)) {
        if (!connectTarget(target, opts, err))
            return false;
    }

    const int timeoutMs = opts.batchMode && opts.connectTimeoutSec > 0
                              ? (opts.connectTimeoutSec + 30) * 1000
                              : 0;
    return exec(command, result, err, timeoutMs);
}
