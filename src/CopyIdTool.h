// CopyIdTool.h
//
// Optional fast path: delegate the whole installation to OpenSSH's
// ssh-copy-id when it is installed. KeyRegistrar falls back to its own
// registration when the tool is absent or fails.

#pragma once

#include <QString>

#include "KeyMaterial.h"
#include "Target.h"

class CopyIdTool
{
public:
    virtual ~CopyIdTool() = default;

    virtual bool isAvailable() const = 0;
    virtual bool copy(const Target& target, const KeyMaterial& key, QString* err = nullptr) = 0;
};

class SshCopyIdTool : public CopyIdTool
{
public:
    explicit SshCopyIdTool(const QString& binary = QStringLiteral("ssh-copy-id"));

    bool isAvailable() const override;
    bool copy(const Target& target, const KeyMaterial& key, QString* err = nullptr) override;

private:
    QString m_binary;
};
