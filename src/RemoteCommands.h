// RemoteCommands.h
//
// Builders for the shell commands sent to the remote host.
//
// Every command is wrapped as `sh -c '<script>'` so it behaves the same
// whatever the remote login shell is, and every piece of user data (key
// line, fingerprint token) is embedded single-quoted through shQuote().
// Scripts are joined with "; " rather than newlines (csh rejects newlines
// inside quotes).

#pragma once

#include <QString>

namespace RemoteCommands {

    // POSIX single-quote escaping: abc'd -> 'abc'"'"'d'
    QString shQuote(const QString& s);

    // `sh -c <quoted script>`
    QString wrapSh(const QString& script);

    // Exit 0 iff authorized_keys contains the token as a fixed substring.
    // A missing file is a silent non-match.
    QString presenceCheck(const QString& fingerprintToken);

    // One round trip:
    //   ~/.ssh (700) -> append key line -> authorized_keys (600)
    //   -> sort -u into a temp file (600) -> mv over the original.
    // On a failed dedupe the temp file is removed and the script exits 1;
    // the original file is never truncated.
    QString registerKey(const QString& keyLine);

    // Trivial command for the batch-mode connection test.
    QString verifyEcho();

    // Text printed by verifyEcho().
    QString verifyBanner();

} // namespace RemoteCommands
