/*
 * Copyright (c) 2025, Petr Bena <petr@bena.rocks>
 * All rights reserved.
 */

#ifndef XENCTL_TESTS_TEST_HELPERS_H
#define XENCTL_TESTS_TEST_HELPERS_H

#include <QList>
#include <QSharedPointer>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include "xenctl/utils/remoteshell.h"
#include "xenctl/utils/secretprompt.h"
#include "fakexenserver.h"

namespace XenCtl
{
    class Session;
}

// Logs in to the fake server with its password
QSharedPointer<XenCtl::Session> OpenFakeSession(const QSharedPointer<FakeXenServer>& server,
                                                const QString& endpoint = "xen1.example.com");

QVariantMap MakeVmRecord(const QString& name, const QString& uuid, const QString& powerState = "Halted",
                         bool isTemplate = false, const QStringList& vbds = QStringList());

class FakeSecretPrompt : public XenCtl::SecretPrompt
{
    public:
        explicit FakeSecretPrompt(const QString& answer) : m_answer(answer) {}

        QString ReadSecret(const QString& prompt) override
        {
            this->prompts.append(prompt);
            return this->m_answer;
        }

        QStringList prompts;

    private:
        QString m_answer;
};

class FakeRemoteShell : public XenCtl::RemoteShell
{
    public:
        explicit FakeRemoteShell(int exitCode = 0) : m_exitCode(exitCode) {}

        int Execute(const XenCtl::RemoteCommand& command) override
        {
            this->commands.append(command);
            return this->m_exitCode;
        }

        QList<XenCtl::RemoteCommand> commands;

    private:
        int m_exitCode;
};

#endif // XENCTL_TESTS_TEST_HELPERS_H
