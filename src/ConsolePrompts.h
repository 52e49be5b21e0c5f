// ConsolePrompts.h
//
// Terminal questions for the interactive CLI. Prompts go to stderr so
// stdout only carries results. When stdin is not a terminal, or on EOF,
// every question takes its default answer ("no" / empty).

#pragma once

#include <QString>

namespace ConsolePrompts {

    bool stdinIsTerminal();

    // "<question> (y/N): " -> true only for y/yes
    bool confirm(const QString& question);

    // Plain line; ok=false on EOF or non-terminal stdin.
    QString readLine(const QString& prompt, bool* ok);

    // Line read with terminal echo disabled.
    QString readSecret(const QString& prompt, bool* ok);

} // namespace ConsolePrompts
