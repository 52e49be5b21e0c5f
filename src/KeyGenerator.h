// KeyGenerator.h
//
// Purpose:
//   KeyGen capability: create an ed25519 key pair at <privPath> and
//   <privPath>.pub. Existing files at those paths are replaced; asking the
//   user first is KeyRegistrar's job.
//
//   Implementations:
//     - SshKeygenGenerator: runs OpenSSH's ssh-keygen (prompts for a
//       passphrase on the terminal)
//     - SodiumKeyGenerator: libsodium crypto_sign_keypair() serialized by
//       OpenSshEd25519Key (unencrypted private key, mode 0600)

#pragma once

#include <QString>

class KeyGenerator
{
public:
    virtual ~KeyGenerator() = default;

    virtual bool generate(const QString& privPath, const QString& comment, QString* err = nullptr) = 0;

    virtual QString name() const = 0;
};

class SshKeygenGenerator : public KeyGenerator
{
public:
    explicit SshKeygenGenerator(const QString& binary = QStringLiteral("ssh-keygen"));

    bool generate(const QString& privPath, const QString& comment, QString* err = nullptr) override;
    QString name() const override { return QStringLiteral("ssh-keygen"); }

private:
    QString m_binary;
};

class SodiumKeyGenerator : public KeyGenerator
{
public:
    bool generate(const QString& privPath, const QString& comment, QString* err = nullptr) override;
    QString name() const override { return QStringLiteral("sodium"); }
};

// Creates the parent directory of a key file with mode 0700 if missing.
bool ensureKeyDir(const QString& keyPath, QString* err = nullptr);
