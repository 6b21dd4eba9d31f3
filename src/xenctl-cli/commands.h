/*
 * Copyright (c) 2025, Petr Bena <petr@bena.rocks>
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef XENCTL_CLI_COMMANDS_H
#define XENCTL_CLI_COMMANDS_H

#include <QSharedPointer>
#include <QString>
#include <QStringList>
#include <QTextStream>
#include <stdexcept>

namespace XenCtl
{
    class Session;
    struct PollOptions;
}

/**
 * @brief Wrong command line; reported with exit status 2
 */
class UsageError : public std::runtime_error
{
    public:
        explicit UsageError(const QString& message) : std::runtime_error(message.toStdString()) {}
};

struct ConnectionOptions
{
    QString host;
    QString user;
};

/**
 * @brief The xenctl sub commands
 *
 * Each command parses its own arguments, opens the session it needs and
 * prints its output on stdout. Errors are thrown.
 */
class Commands
{
    public:
        Commands(const ConnectionOptions& connection, QTextStream& out);

        static QStringList Names();
        static QString Usage();

        // @return Process exit status
        int Run(const QString& command, const QStringList& arguments);

    private:
        QSharedPointer<XenCtl::Session> openSession(const QString& host, const QString& user);
        QSharedPointer<XenCtl::Session> openSession();
        XenCtl::PollOptions pollOptions() const;

        int methods(const QStringList& arguments);
        int call(const QStringList& arguments);
        int listVms(const QStringList& arguments);
        int listTemplates(const QStringList& arguments);
        int listHosts(const QStringList& arguments);
        int createVm(const QStringList& arguments);
        int destroyVm(const QStringList& arguments);
        int importVm(const QStringList& arguments);
        int exportVm(const QStringList& arguments);
        int transferVm(const QStringList& arguments);
        int setTemplate(const QStringList& arguments);
        int runScript(const QStringList& arguments);

        ConnectionOptions m_connection;
        QTextStream& m_out;
};

#endif // XENCTL_CLI_COMMANDS_H
