/*
 * ssh-keyreg — register a public key for passwordless SSH login
 *
 * Copyright (c) 2025 Timo Erkvaara / CPUNK
 *
 * Licensed under the Apache License, Version 2.0
 * http://www.apache.org/licenses/LICENSE-2.0
 */

#include <QCoreApplication>
#include <QDebug>
#include <QJsonObject>
#include <QUuid>

#include <cstdio>
#include <memory>

#include "AppSettings.h"
#include "AuditLogger.h"
#include "ConsolePrompts.h"
#include "CopyIdTool.h"
#include "KeyGenerator.h"
#include "KeyRegOptions.h"
#include "KeyRegistrar.h"
#include "Logger.h"
#include "OpenSshExec.h"
#include "SshClient.h"

// main.cpp
// --------
// Entry point.
//
// Responsibilities:
// - Set application metadata (QSettings location, audit directory)
// - Parse the command line into an immutable KeyRegOptions
// - Load AppSettings and let flags override them
// - Install console/file logging and the audit trail
// - Wire the chosen RemoteExec / KeyGenerator backends and console prompts
//   into KeyRegistrar and return its exit status

static void printText(FILE* stream, const QString& text)
{
    const QByteArray utf8 = text.toUtf8();
    std::fputs(utf8.constData(), stream);
    if (!text.endsWith('\n'))
        std::fputc('\n', stream);
    std::fflush(stream);
}

static RegistrarPrompts consolePrompts(bool assumeYes)
{
    RegistrarPrompts p;

    // Never overwrite a private key without a human saying so
    p.confirmOverwrite = [assumeYes](const QString&) {
        if (assumeYes) return false;
        return ConsolePrompts::confirm(QStringLiteral("Overwrite it?"));
    };

    p.confirmContinueWithDuplicate = [assumeYes](const Target&) {
        if (assumeYes) return true;
        return ConsolePrompts::confirm(QStringLiteral("Continue anyway?"));
    };

    p.keyComment = [assumeYes]() -> QString {
        if (assumeYes) return QString();
        bool ok = false;
        return ConsolePrompts::readLine(QStringLiteral("Enter your email (key comment, empty for user@host): "), &ok);
    };

    return p;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // ~/.config/ssh-keyreg/ssh-keyreg.conf, ~/.local/share/ssh-keyreg/ssh-keyreg/audit
    QCoreApplication::setOrganizationName("ssh-keyreg");
    QCoreApplication::setApplicationName("ssh-keyreg");
    QCoreApplication::setApplicationVersion("1.0.0");

    Logger::install("ssh-keyreg");

    const ParseResult parsed = parseCommandLine(QCoreApplication::arguments());
    switch (parsed.status) {
    case ParseStatus::Help:
    case ParseStatus::Version:
        printText(stdout, parsed.message);
        return 0;
    case ParseStatus::Error:
        qCritical().noquote() << parsed.message;
        printText(stderr, usageText());
        return 1;
    case ParseStatus::Ok:
        break;
    }

    const KeyRegOptions& opts = parsed.options;
    const AppSettings settings = AppSettings::load();

    Logger::setLogLevel(opts.logLevel >= 0 ? opts.logLevel : settings.logLevel);
    Logger::setLogFilePath(!opts.logFile.isEmpty() ? expandHomePath(opts.logFile) : settings.logFilePath);

    AuditLogger::install("ssh-keyreg");
    AuditLogger::setEnabled(settings.auditEnabled);
    AuditLogger::setAuditDirOverride(settings.auditDirPath);
    AuditLogger::setSessionId(QUuid::createUuid().toString(QUuid::WithoutBraces));
    {
        QJsonObject f;
        f.insert("target", opts.target.userHost);
        f.insert("port", opts.target.port);
        f.insert("generate", opts.generate);
        AuditLogger::writeEvent("session.start", f);
    }

    // --- Remote execution backend ---
    const QString backend = opts.backend.isEmpty() ? settings.backend : opts.backend;
    std::unique_ptr<RemoteExec> remote;
    if (backend == "libssh") {
        auto client = std::make_unique<SshClient>();
        if (!opts.assumeYes) {
            client->setSecretProvider([](const QString& prompt, bool echo, bool* ok) {
                return echo ? ConsolePrompts::readLine(prompt, ok)
                            : ConsolePrompts::readSecret(prompt, ok);
            });
            client->setHostKeyConfirm([](const QString& host, const QString& fingerprint) {
                qWarning().noquote() << QString("The authenticity of host '%1' can't be established.").arg(host);
                qWarning().noquote() << QString("Host key fingerprint is %1.").arg(fingerprint);
                return ConsolePrompts::confirm(QStringLiteral("Are you sure you want to continue connecting?"));
            });
        }
        remote = std::move(client);
    } else {
        remote = std::make_unique<OpenSshExec>(settings.sshBinary);
    }

    // --- Key generator ---
    const QString generator = opts.generator.isEmpty() ? settings.generator : opts.generator;
    std::unique_ptr<KeyGenerator> keygen;
    if (generator == "sodium")
        keygen = std::make_unique<SodiumKeyGenerator>();
    else
        keygen = std::make_unique<SshKeygenGenerator>();

    SshCopyIdTool copyId;

    KeyRegistrar::Config cfg;
    cfg.defaultPublicKey  = settings.defaultPublicKey;
    cfg.generatedKeyPath  = settings.generatedKeyPath;
    cfg.connectTimeoutSec = settings.connectTimeoutSec;
    // ssh-copy-id always speaks OpenSSH; a libssh run stays on libssh
    cfg.useCopyId         = settings.copyIdEnabled && backend == "openssh";

    KeyRegistrar registrar(*remote, *keygen, consolePrompts(opts.assumeYes), cfg, &copyId);
    const int rc = registrar.run(opts);

    QJsonObject f;
    f.insert("exit_code", rc);
    AuditLogger::writeEvent("session.end", f);
    return rc;
}
