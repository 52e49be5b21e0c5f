// KeyRegOptions.cpp
//
// QCommandLineParser front end. parse() (not process()) is used so that
// errors and --help come back to main() instead of exiting from inside Qt.

#include "KeyRegOptions.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>

namespace {

struct CliOptions {
    QCommandLineOption help     { QStringList{ "h", "help" }, "Show this help and exit." };
    QCommandLineOption generate { QStringList{ "g", "generate" }, "Generate a new ed25519 key pair before registering it." };
    QCommandLineOption port     { QStringList{ "p", "port" }, "Remote SSH port (default: 22).", "PORT", "22" };
    QCommandLineOption yes      { QStringList{ "y", "yes" }, "Do not prompt: continue if the key is already present, reuse an existing generated key." };
    QCommandLineOption noCopyId { "no-copy-id", "Do not use ssh-copy-id even if it is installed." };
    QCommandLineOption backend  { "backend", "Remote execution backend: openssh or libssh.", "NAME" };
    QCommandLineOption keygen   { "keygen", "Key generator for --generate: ssh-keygen or sodium.", "NAME" };
    QCommandLineOption verbose  { QStringList{ "v", "verbose" }, "Debug output." };
    QCommandLineOption quiet    { QStringList{ "q", "quiet" }, "Only print errors." };
    QCommandLineOption logFile  { "log-file", "Also write the log to PATH.", "PATH" };
    QCommandLineOption version  { "version", "Show version and exit." };

    void addTo(QCommandLineParser& p) const
    {
        p.setApplicationDescription(
            "Register a public key in ~/.ssh/authorized_keys on a remote host\n"
            "for passwordless SSH login.");
        p.setSingleDashWordOptionMode(QCommandLineParser::ParseAsCompactedShortOptions);
        p.addOptions({ help, generate, port, yes, noCopyId, backend, keygen, verbose, quiet, logFile, version });
        p.addPositionalArgument("target", "Remote user and host, e.g. user@192.168.1.100", "user@host");
        p.addPositionalArgument("public-key-path", "Public key to register (default: ~/.ssh/id_rsa.pub).",
                                "[public-key-path]");
    }
};

} // namespace

QString usageText()
{
    QCommandLineParser p;
    CliOptions cli;
    cli.addTo(p);

    QString text = p.helpText();
    text += "\nExamples:\n"
            "  ssh-keyreg root@192.168.1.100\n"
            "  ssh-keyreg user@example.com ~/.ssh/id_ed25519.pub\n"
            "  ssh-keyreg -g -p 2222 user@example.com\n";
    return text;
}

ParseResult parseCommandLine(const QStringList& args)
{
    ParseResult r;

    QCommandLineParser p;
    CliOptions cli;
    cli.addTo(p);

    if (!p.parse(args)) {
        r.message = p.errorText();
        return r;
    }

    if (p.isSet(cli.help)) {
        r.status = ParseStatus::Help;
        r.message = usageText();
        return r;
    }
    if (p.isSet(cli.version)) {
        r.status = ParseStatus::Version;
        r.message = QString("%1 %2").arg(QCoreApplication::applicationName(),
                                         QCoreApplication::applicationVersion());
        return r;
    }

    KeyRegOptions& o = r.options;

    bool portOk = false;
    const int port = p.value(cli.port).trimmed().toInt(&portOk);
    if (!portOk || port < 1 || port > 65535) {
        r.message = QString("Invalid port: %1").arg(p.value(cli.port));
        return r;
    }

    const QStringList pos = p.positionalArguments();
    if (pos.isEmpty()) {
        r.message = QStringLiteral("You must specify the remote server (user@host).");
        return r;
    }
    if (pos.size() > 2) {
        r.message = QString("Invalid argument: %1").arg(pos.at(2));
        return r;
    }

    QString err;
    if (!Target::parse(pos.at(0), port, &o.target, &err)) {
        r.message = err;
        return r;
    }
    if (pos.size() == 2)
        o.publicKeyPath = pos.at(1);

    o.generate  = p.isSet(cli.generate);
    o.assumeYes = p.isSet(cli.yes);
    o.promptIfDuplicate = !o.assumeYes;
    o.noCopyId  = p.isSet(cli.noCopyId);

    if (p.isSet(cli.backend)) {
        o.backend = p.value(cli.backend).trimmed().toLower();
        if (o.backend != "openssh" && o.backend != "libssh") {
            r.message = QString("Unknown backend '%1' (expected openssh or libssh).").arg(o.backend);
            return r;
        }
    }
    if (p.isSet(cli.keygen)) {
        o.generator = p.value(cli.keygen).trimmed().toLower();
        if (o.generator != "ssh-keygen" && o.generator != "sodium") {
            r.message = QString("Unknown key generator '%1' (expected ssh-keygen or sodium).").arg(o.generator);
            return r;
        }
    }

    if (p.isSet(cli.verbose) && p.isSet(cli.quiet)) {
        r.message = QStringLiteral("--verbose and --quiet are mutually exclusive.");
        return r;
    }
    if (p.isSet(cli.verbose)) o.logLevel = 2;
    if (p.isSet(cli.quiet))   o.logLevel = 0;
    if (p.isSet(cli.logFile)) o.logFile = p.value(cli.logFile);

    r.status = ParseStatus::Ok;
    return r;
}
