// Target.h
//
// Remote login target: "user@host" plus SSH port.
// Built once from the command line and passed around as const&.

#pragma once

#include <QString>

struct Target {
    QString userHost;   // exactly as given on the command line
    QString user;       // may be empty -> transport picks the login name
    QString host;
    int     port = 22;

    // Parses "user@host" (user optional). Rejects empty hosts, whitespace,
    // a leading '-' (would be read as an ssh option) and ports outside 1..65535.
    static bool parse(const QString& text, int port, Target* out, QString* err = nullptr);

    // "user@host" or "user@host:2222" when the port is not the default.
    QString display() const;
};
