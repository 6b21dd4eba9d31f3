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

#ifndef XENCTL_REMOTESHELL_H
#define XENCTL_REMOTESHELL_H

#include "../xenctl_global.h"
#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace XenCtl
{
    struct XENCTL_EXPORT RemoteCommand
    {
        QString host;
        QString user;       // empty: ssh default
        int port = 0;       // 0: ssh default
        QString password;   // null: key based login
        bool sudo = false;  // run through sudo, password fed on stdin
        QString command;    // fed to the remote shell on stdin
    };

    /**
     * @brief Runs a command body on a remote machine
     */
    class XENCTL_EXPORT RemoteShell
    {
        public:
            virtual ~RemoteShell() {}

            // @return Exit code of the remote command
            virtual int Execute(const RemoteCommand& command) = 0;
    };

    /**
     * @brief RemoteShell on top of the OpenSSH client
     *
     * When a password is known the client is wrapped in "sshpass -e", the
     * password travelling in the SSHPASS environment variable. Output of
     * the remote command is forwarded to our own stdout and stderr.
     */
    class XENCTL_EXPORT SshRemoteShell : public RemoteShell
    {
        public:
            explicit SshRemoteShell(const QString& sshProgram = "ssh", const QString& sshpassProgram = "sshpass");

            int Execute(const RemoteCommand& command) override;

            // Program and arguments Execute would start, and the data it writes on stdin
            QStringList BuildArguments(const RemoteCommand& command, QString* program) const;
            static QByteArray BuildStdin(const RemoteCommand& command);

        private:
            QString m_sshProgram;
            QString m_sshpassProgram;
    };

    /**
     * @brief Password remembered between remote commands of one run
     *
     * Owned by the caller; nothing is kept beyond its lifetime.
     */
    class XENCTL_EXPORT CredentialCache
    {
        public:
            bool HasPassword() const { return !this->m_password.isNull(); }
            QString Password() const { return this->m_password; }
            void Store(const QString& password) { this->m_password = password; }
            void Clear() { this->m_password = QString(); }

        private:
            QString m_password;
    };
}

#endif // XENCTL_REMOTESHELL_H
