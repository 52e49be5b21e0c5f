// KeyRegistrar.h
//
// Purpose:
//   End-to-end public key registration on a remote host:
//
//     resolve/generate key -> ssh-copy-id fast path (optional)
//       -> remote duplicate check -> append + dedupe -> batch-mode login test
//
//   All side effects go through injected collaborators (RemoteExec,
//   KeyGenerator, CopyIdTool) and all questions through RegistrarPrompts,
//   so the workflow runs unattended under --yes and in tests.
//
// Exit status contract of run():
//   0 = key registered, or the user declined at the duplicate prompt
//   1 = missing/invalid key, failed generation, failed registration

#pragma once

#include <QString>
#include <functional>

#include "KeyMaterial.h"
#include "KeyRegOptions.h"
#include "Target.h"

class CopyIdTool;
class KeyGenerator;
class RemoteExec;

enum class RegistrarError {
    None,
    KeyFileNotFound,
    KeyGenFailed,
    InvalidKey,
    RemoteExecFailed
};

QString registrarErrorName(RegistrarError e);

struct RegistrarPrompts {
    // A key already exists where --generate would write. true = overwrite.
    std::function<bool(const QString& privPath)> confirmOverwrite;

    // The key is already on the server. true = register anyway.
    std::function<bool(const Target& target)> confirmContinueWithDuplicate;

    // Comment for a generated key; empty -> user@hostname.
    std::function<QString()> keyComment;
};

class KeyRegistrar
{
public:
    struct Config {
        QString defaultPublicKey;     // fallback when no path is given
        QString generatedKeyPath;     // private key path used by --generate
        int     connectTimeoutSec = 5;
        bool    useCopyId = true;
    };

    KeyRegistrar(RemoteExec& remote,
                 KeyGenerator& keygen,
                 RegistrarPrompts prompts,
                 Config config,
                 CopyIdTool* copyId = nullptr);

    bool resolveKeyMaterial(const QString& explicitPath,
                            bool generateRequested,
                            KeyMaterial* out,
                            RegistrarError* code = nullptr,
                            QString* err = nullptr);

    bool isKeyAlreadyPresent(const Target& target, const QString& keyContent);

    bool registerKey(const Target& target,
                     const KeyMaterial& key,
                     RegistrarError* code = nullptr,
                     QString* err = nullptr);

    // Diagnostic only; never undoes a registration.
    bool verifyConnection(const Target& target, const QString& identityFile = QString());

    int run(const KeyRegOptions& options);

    const Config& config() const { return m_config; }

private:
    bool generateKey(const QString& privPath, RegistrarError* code, QString* err);
    QString defaultComment() const;

    RemoteExec&      m_remote;
    KeyGenerator&    m_keygen;
    RegistrarPrompts m_prompts;
    Config           m_config;
    CopyIdTool*      m_copyId = nullptr;   // not owned, may be null
};
