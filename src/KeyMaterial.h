// KeyMaterial.h
//
// Purpose:
//   A local OpenSSH public key file, loaded once and read-only afterwards.
//
//   line format:  <type> <base64-body> [comment...]
//
//   The base64 body ("fingerprint token") is what the remote duplicate
//   check searches for. It is not a cryptographic fingerprint; for display
//   we also compute the SHA256 form printed by `ssh-keygen -lf -E sha256`.

#pragma once

#include <QString>

struct KeyMaterial {
    QString path;              // public key file
    QString content;           // raw file text
    QString keyLine;           // content without surrounding whitespace
    QString keyType;           // "ssh-ed25519", "ssh-rsa", ...
    QString fingerprintToken;  // second field of the key line
    QString comment;           // everything after the body (may be empty)

    // KeyStore read. Fails if the file is missing or empty, if it holds
    // a private key, or if the first line has fewer than two fields.
    static bool load(const QString& path, KeyMaterial* out, QString* err = nullptr);

    // Second whitespace-delimited field of the first non-empty line.
    static QString fingerprintTokenOf(const QString& keyContent);

    // Known OpenSSH public key type prefixes.
    static bool looksLikeOpenSshPubKey(const QString& line);

    bool isValid() const { return !keyLine.isEmpty() && !fingerprintToken.isEmpty(); }

    // True if the line would split into several authorized_keys entries.
    bool hasLineBreaks() const;

    // "<path without .pub>" if that private key exists on disk, else empty.
    QString privateKeyPath() const;

    // "SHA256:<base64 without padding>" over the decoded key blob.
    QString sha256Fingerprint() const;
};
