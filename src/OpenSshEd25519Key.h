#pragma once
#include <QByteArray>
#include <QString>

//
// OpenSSH serialization of an Ed25519 key pair produced by libsodium.
//
// Inputs are raw crypto_sign_* buffers:
//   pub32  - crypto_sign_PUBLICKEYBYTES (32)
//   priv64 - crypto_sign_SECRETKEYBYTES (64), laid out seed32 || pub32,
//            which is exactly what OpenSSH stores for ssh-ed25519
//
// Nothing here touches the filesystem; SodiumKeyGenerator writes the files
// and sets their permissions.
//

namespace OpenSshEd25519Key {

    inline constexpr int kPublicKeyBytes  = 32;
    inline constexpr int kPrivateKeyBytes = 64;

    // Wire blob: string "ssh-ed25519" || string pub32
    QByteArray publicBlob(const QByteArray &pub32);

    // "ssh-ed25519 <base64(blob)> <comment>" (no trailing newline).
    QString publicKeyLine(const QByteArray &pub32, const QString &comment);

    // Unencrypted "openssh-key-v1" file, armoured and wrapped at 70 columns.
    // checkint is the value written twice at the start of the private
    // section; pass a random value.
    QByteArray privateKeyFile(const QByteArray &pub32,
                              const QByteArray &priv64,
                              const QString &comment,
                              quint32 checkint);

} // namespace OpenSshEd25519Key
