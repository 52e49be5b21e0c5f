// KeyRegistrar.cpp
//
// Notes:
//   - Each step logs one severity-tagged line; fatal steps log ERROR and
//     make run() return 1, the connection test only ever warns.
//   - Nothing is retried. A remote failure ends that step.
//   - Audit events carry the SHA256 fingerprint, never the key body.

#include "KeyRegistrar.h"

#include <QDebug>
#include <QFileInfo>
#include <QJsonObject>
#include <QSysInfo>

#include "AppSettings.h"
#include "AuditLogger.h"
#include "CopyIdTool.h"
#include "KeyGenerator.h"
#include "RemoteCommands.h"
#include "RemoteExec.h"

QString registrarErrorName(RegistrarError e)
{
    switch (e) {
        case RegistrarError::None:             return "None";
        case RegistrarError::KeyFileNotFound:  return "KeyFileNotFound";
        case RegistrarError::KeyGenFailed:     return "KeyGenFailed";
        case RegistrarError::InvalidKey:       return "InvalidKey";
        case RegistrarError::RemoteExecFailed: return "RemoteExecFailed";
    }
    return "Unknown";
}

static QJsonObject auditFields(const Target& target, const KeyMaterial* key = nullptr)
{
    QJsonObject f;
    f.insert("target", target.userHost);
    f.insert("port", target.port);
    if (key) {
        f.insert("key_path", key->path);
        f.insert("key_type", key->keyType);
        f.insert("fingerprint", key->sha256Fingerprint());
    }
    return f;
}

static void setError(RegistrarError* code, QString* err, RegistrarError c, const QString& msg)
{
    if (code) *code = c;
    if (err) *err = msg;
}

KeyRegistrar::KeyRegistrar(RemoteExec& remote,
                           KeyGenerator& keygen,
                           RegistrarPrompts prompts,
                           Config config,
                           CopyIdTool* copyId)
    : m_remote(remote)
    , m_keygen(keygen)
    , m_prompts(std::move(prompts))
    , m_config(std::move(config))
    , m_copyId(copyId)
{
}

QString KeyRegistrar::defaultComment() const
{
    const QString user = qEnvironmentVariable("USER", "user");
    return QString("%1@%2").arg(user, QSysInfo::machineHostName());
}

bool KeyRegistrar::generateKey(const QString& privPath, RegistrarError* code, QString* err)
{
    QString comment = m_prompts.keyComment ? m_prompts.keyComment().trimmed() : QString();
    if (comment.isEmpty())
        comment = defaultComment();

    qInfo().noquote() << QString("Generating new ed25519 key pair (%1)...").arg(m_keygen.name());

    QString e;
    if (!m_keygen.generate(privPath, comment, &e)) {
        setError(code, err, RegistrarError::KeyGenFailed, "Failed to generate SSH key: " + e);
        return false;
    }

    qInfo().noquote() << QString("SSH key generated: %1").arg(privPath);

    QJsonObject f;
    f.insert("key_path", privPath);
    f.insert("generator", m_keygen.name());
    AuditLogger::writeEvent("key.generated", f);
    return true;
}

// ------------------------------------------------------------
// resolveKeyMaterial(): generate (optional) + load the public key
// ------------------------------------------------------------
bool KeyRegistrar::resolveKeyMaterial(const QString& explicitPath,
                                      bool generateRequested,
                                      KeyMaterial* out,
                                      RegistrarError* code,
                                      QString* err)
{
    if (code) *code = RegistrarError::None;
    if (err) err->clear();

    const QString explicitExpanded = expandHomePath(explicitPath);
    QString pubPath;

    if (generateRequested) {
        QString privPath = explicitExpanded.isEmpty() ? m_config.generatedKeyPath : explicitExpanded;
        if (privPath.endsWith(".pub"))
            privPath.chop(4);
        pubPath = privPath + ".pub";

        const bool exists = QFileInfo::exists(privPath) || QFileInfo::exists(pubPath);
        if (exists) {
            qWarning().noquote() << QString("SSH key already exists at %1").arg(privPath);
            const bool overwrite = m_prompts.confirmOverwrite && m_prompts.confirmOverwrite(privPath);
            if (overwrite) {
                if (!generateKey(privPath, code, err))
                    return false;
            } else {
                qInfo().noquote() << "Using existing key";
            }
        } else if (!generateKey(privPath, code, err)) {
            return false;
        }
    } else {
        pubPath = explicitExpanded.isEmpty() ? m_config.defaultPublicKey : explicitExpanded;
    }

    const QFileInfo fi(pubPath);
    if (!fi.exists() || (fi.isFile() && fi.size() == 0)) {
        setError(code, err, RegistrarError::KeyFileNotFound,
                 fi.exists() ? QString("Public key file is empty: %1").arg(pubPath)
                             : QString("Public key file not found: %1").arg(pubPath));
        return false;
    }

    QString e;
    KeyMaterial key;
    if (!KeyMaterial::load(pubPath, &key, &e)) {
        setError(code, err, RegistrarError::InvalidKey, e);
        return false;
    }

    if (out) *out = key;
    return true;
}

// ------------------------------------------------------------
// isKeyAlreadyPresent(): substring grep for the base64 body.
// Transport problems count as "not present"; registration will
// surface them as a hard error anyway.
// ------------------------------------------------------------
bool KeyRegistrar::isKeyAlreadyPresent(const Target& target, const QString& keyContent)
{
    const QString token = KeyMaterial::fingerprintTokenOf(keyContent);
    if (token.isEmpty()) {
        qWarning().noquote() << "Public key has no key body; skipping duplicate check";
        return false;
    }

    qInfo().noquote() << "Checking whether the key is already on the server...";

    ExecOptions opts;
    opts.connectTimeoutSec = m_config.connectTimeoutSec;

    RemoteResult res;
    QString e;
    if (!m_remote.run(target, RemoteCommands::presenceCheck(token), opts, &res, &e)) {
        qWarning().noquote() << QString("Could not check existing keys: %1").arg(e);
        return false;
    }

    qDebug().noquote() << QString("presence check exit=%1").arg(res.exitStatus);
    return res.exitStatus == 0;
}

// ------------------------------------------------------------
// registerKey(): single round trip append + chmod + sort -u + rename
// ------------------------------------------------------------
bool KeyRegistrar::registerKey(const Target& target,
                               const KeyMaterial& key,
                               RegistrarError* code,
                               QString* err)
{
    if (code) *code = RegistrarError::None;
    if (err) err->clear();

    if (!key.isValid()) {
        setError(code, err, RegistrarError::InvalidKey, "Public key is empty or malformed.");
        return false;
    }
    if (key.hasLineBreaks()) {
        setError(code, err, RegistrarError::InvalidKey,
                 QString("%1 must contain exactly one key line.").arg(key.path));
        return false;
    }

    qInfo().noquote() << QString("Adding SSH key to server %1...").arg(target.display());

    ExecOptions opts;
    opts.connectTimeoutSec = m_config.connectTimeoutSec;

    RemoteResult res;
    QString e;
    if (!m_remote.run(target, RemoteCommands::registerKey(key.keyLine), opts, &res, &e)) {
        setError(code, err, RegistrarError::RemoteExecFailed, "Failed to add SSH key: " + e);
        AuditLogger::writeEvent("key.register_failed", auditFields(target, &key));
        return false;
    }

    if (res.exitStatus != 0) {
        const QString detail = res.err.trimmed();
        setError(code, err, RegistrarError::RemoteExecFailed,
                 detail.isEmpty()
                     ? QString("Failed to add SSH key (remote exit %1).").arg(res.exitStatus)
                     : QString("Failed to add SSH key (remote exit %1): %2").arg(res.exitStatus).arg(detail));
        AuditLogger::writeEvent("key.register_failed", auditFields(target, &key));
        return false;
    }

    qInfo().noquote() << "SSH key added successfully!";
    AuditLogger::writeEvent("key.registered", auditFields(target, &key));
    return true;
}

bool KeyRegistrar::verifyConnection(const Target& target, const QString& identityFile)
{
    qInfo().noquote() << "Testing connection...";

    ExecOptions opts;
    opts.batchMode = true;
    opts.connectTimeoutSec = m_config.connectTimeoutSec;
    opts.identityFile = identityFile;

    RemoteResult res;
    QString e;
    const bool ran = m_remote.run(target, RemoteCommands::verifyEcho(), opts, &res, &e);
    const bool ok = ran && res.exitStatus == 0;

    if (ok) {
        qInfo().noquote() << "Connection test succeeded!";
        AuditLogger::writeEvent("connection.verified", auditFields(target));
    } else {
        qDebug().noquote() << QString("verification failed: %1")
                              .arg(ran ? QString("exit %1").arg(res.exitStatus) : e);
        AuditLogger::writeEvent("connection.verify_failed", auditFields(target));
    }
    return ok;
}

// ------------------------------------------------------------
// run(): top-level workflow, returns the process exit status
// ------------------------------------------------------------
int KeyRegistrar::run(const KeyRegOptions& options)
{
    const Target& target = options.target;

    KeyMaterial key;
    RegistrarError code = RegistrarError::None;
    QString err;

    if (!resolveKeyMaterial(options.publicKeyPath, options.generate, &key, &code, &err)) {
        qCritical().noquote() << err;
        return 1;
    }

    qInfo().noquote() << QString("Using public key %1 (%2 %3)")
                         .arg(key.path, key.keyType, key.sha256Fingerprint());
    if (!KeyMaterial::looksLikeOpenSshPubKey(key.keyLine))
        qWarning().noquote() << QString("Unrecognized key type '%1'; registering it anyway").arg(key.keyType);

    if (key.hasLineBreaks()) {
        qCritical().noquote() << QString("%1 must contain exactly one key line.").arg(key.path);
        return 1;
    }

    // Fast path: ssh-copy-id, when present
    if (m_config.useCopyId && !options.noCopyId && m_copyId && m_copyId->isAvailable()) {
        qInfo().noquote() << "Using ssh-copy-id to add the key...";
        if (m_copyId->copy(target, key, &err)) {
            qInfo().noquote() << "SSH key added successfully using ssh-copy-id!";
            AuditLogger::writeEvent("copyid.used", auditFields(target, &key));
            return 0;
        }
        qWarning().noquote() << QString("ssh-copy-id failed (%1), trying manual method...").arg(err);
    }

    qInfo().noquote() << QString("Using manual method via %1").arg(m_remote.name());

    if (isKeyAlreadyPresent(target, key.keyLine)) {
        qWarning().noquote() << "This key is already present on the server";
        AuditLogger::writeEvent("key.duplicate_detected", auditFields(target, &key));

        if (options.promptIfDuplicate) {
            const bool proceed = m_prompts.confirmContinueWithDuplicate &&
                                 m_prompts.confirmContinueWithDuplicate(target);
            if (!proceed) {
                qInfo().noquote() << "Operation cancelled";
                return 0;
            }
        }
    }

    if (!registerKey(target, key, &code, &err)) {
        qCritical().noquote() << err;
        return 1;
    }

    if (!verifyConnection(target, key.privateKeyPath()))
        qWarning().noquote() << "Key added, but the connection test failed";

    qInfo().noquote() << "Done!";
    qInfo().noquote() << QString("You can now connect with: ssh -p %1 %2").arg(target.port).arg(target.userHost);
    return 0;
}
