// ConsolePrompts.cpp

#include "ConsolePrompts.h"

#include <QTextStream>

#include <cstdio>
#include <termios.h>
#include <unistd.h>

namespace {

QTextStream& stdinStream()
{
    static QTextStream in(stdin);
    return in;
}

void printPrompt(const QString& prompt)
{
    const QByteArray p = prompt.toUtf8();
    std::fputs(p.constData(), stderr);
    std::fflush(stderr);
}

// Restores the saved terminal mode when leaving scope.
class EchoOffGuard
{
public:
    EchoOffGuard()
    {
        if (tcgetattr(STDIN_FILENO, &m_saved) != 0)
            return;
        termios silent = m_saved;
        silent.c_lflag &= ~ECHO;
        m_active = tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
    }
    ~EchoOffGuard()
    {
        if (m_active)
            tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
    }

    EchoOffGuard(const EchoOffGuard&) = delete;
    EchoOffGuard& operator=(const EchoOffGuard&) = delete;

private:
    termios m_saved{};
    bool    m_active = false;
};

} // namespace

namespace ConsolePrompts {

bool stdinIsTerminal()
{
    return isatty(STDIN_FILENO) != 0;
}

QString readLine(const QString& prompt, bool* ok)
{
    if (ok) *ok = false;
    if (!stdinIsTerminal())
        return QString();

    printPrompt(prompt);
    QString line;
    if (!stdinStream().readLineInto(&line))
        return QString();

    if (ok) *ok = true;
    return line;
}

QString readSecret(const QString& prompt, bool* ok)
{
    if (ok) *ok = false;
    if (!stdinIsTerminal())
        return QString();

    printPrompt(prompt);
    QString line;
    bool got = false;
    {
        EchoOffGuard guard;
        got = stdinStream().readLineInto(&line);
    }
    printPrompt("\n");

    if (!got)
        return QString();
    if (ok) *ok = true;
    return line;
}

bool confirm(const QString& question)
{
    bool ok = false;
    const QString answer = readLine(question + " (y/N): ", &ok).trimmed().toLower();
    if (!ok)
        return false;
    return answer == "y" || answer == "yes";
}

} // namespace ConsolePrompts
