// KeyRegOptions.h
//
// Parsed command line. Built once in main() and passed by const& into
// KeyRegistrar::run(); nothing mutates it afterwards.

#pragma once

#include <QString>
#include <QStringList>

#include "Target.h"

struct KeyRegOptions {
    Target  target;
    QString publicKeyPath;          // explicit positional path (may be empty)
    bool    generate = false;       // -g
    bool    promptIfDuplicate = true;
    bool    assumeYes = false;      // -y: no interactive prompts
    bool    noCopyId = false;

    // Empty / -1 -> take the value from AppSettings
    QString backend;
    QString generator;
    int     logLevel = -1;
    QString logFile;
};

enum class ParseStatus {
    Ok,
    Help,       // print usage, exit 0
    Version,    // print version, exit 0
    Error       // print message + usage, exit 1
};

struct ParseResult {
    ParseStatus   status = ParseStatus::Error;
    QString       message;      // error text, or help/version text
    KeyRegOptions options;
};

// args[0] is the program name, as in QCoreApplication::arguments().
ParseResult parseCommandLine(const QStringList& args);

QString usageText();
