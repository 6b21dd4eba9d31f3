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

#include "remoteshell.h"
#include "../xen/failure.h"
#include <QtCore/QDebug>
#include <QtCore/QProcess>
#include <QtCore/QProcessEnvironment>

namespace XenCtl
{
    SshRemoteShell::SshRemoteShell(const QString& sshProgram, const QString& sshpassProgram)
        : m_sshProgram(sshProgram), m_sshpassProgram(sshpassProgram)
    {
    }

    QStringList SshRemoteShell::BuildArguments(const RemoteCommand& command, QString* program) const
    {
        QStringList arguments;

        if (!command.password.isEmpty())
        {
            *program = this->m_sshpassProgram;
            arguments << "-e" << this->m_sshProgram;
        } else
        {
            *program = this->m_sshProgram;
        }

        arguments << "-o" << "StrictHostKeyChecking=no";
        if (command.port > 0)
            arguments << "-p" << QString::number(command.port);
        if (!command.user.isEmpty())
            arguments << "-l" << command.user;
        arguments << command.host;

        if (command.sudo)
            arguments << "sudo -Sk -p \"\" -- \"$SHELL\"";
        else
            arguments << "\"$SHELL\"";

        return arguments;
    }

    QByteArray SshRemoteShell::BuildStdin(const RemoteCommand& command)
    {
        if (command.sudo)
            return (command.password + "\n" + command.command).toUtf8();
        return command.command.toUtf8();
    }

    int SshRemoteShell::Execute(const RemoteCommand& command)
    {
        QString program;
        const QStringList arguments = this->BuildArguments(command, &program);

        QProcess process;
        process.setProcessChannelMode(QProcess::ForwardedChannels);
        if (!command.password.isEmpty())
        {
            QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
            environment.insert("SSHPASS", command.password);
            process.setProcessEnvironment(environment);
        }

        qDebug() << "SshRemoteShell: running" << program << arguments;

        process.start(program, arguments);
        if (!process.waitForStarted())
            throw Failure(QString("Couldn't establish SSH connection: %1").arg(process.errorString()));

        process.write(BuildStdin(command));
        process.closeWriteChannel();

        if (!process.waitForFinished(-1) || process.exitStatus() != QProcess::NormalExit)
            throw Failure(QString("SSH client terminated abnormally: %1").arg(process.errorString()));

        // 255 is how the OpenSSH client reports its own errors
        if (process.exitCode() == 255)
            throw Failure(QString("Couldn't establish SSH connection to %1").arg(command.host));

        return process.exitCode();
    }
}
