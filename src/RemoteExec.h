// RemoteExec.h
//
// Purpose:
//   "Run command C on host H" capability used by KeyRegistrar.
//
//   Implementations:
//     - OpenSshExec: spawns the OpenSSH client once per command
//     - SshClient:   libssh session, one exec channel per command
//
// Error contract:
//   run() returns false only when the command could not be executed at all
//   (spawn/connect/auth failure). A command that ran and exited non-zero is
//   a successful run() with result->exitStatus != 0.

#pragma once

#include <QString>

#include "Target.h"

struct ExecOptions {
    bool    batchMode = false;      // never prompt; fail instead
    int     connectTimeoutSec = 0;  // <= 0 -> transport default
    QString identityFile;           // private key to offer first (optional)
};

struct RemoteResult {
    int     exitStatus = -1;
    QString out;                    // captured stdout
    QString err;                    // captured stderr (may be empty when forwarded)
};

class RemoteExec
{
public:
    virtual ~RemoteExec() = default;

    virtual bool run(const Target& target,
                     const QString& command,
                     const ExecOptions& opts,
                     RemoteResult* result,
                     QString* err = nullptr) = 0;

    // Short backend label for logs ("openssh", "libssh", ...)
    virtual QString name() const = 0;
};
