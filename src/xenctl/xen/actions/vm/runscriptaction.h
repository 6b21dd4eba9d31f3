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

#ifndef XENCTL_RUNSCRIPTACTION_H
#define XENCTL_RUNSCRIPTACTION_H

#include "../../operation.h"
#include "../../vmhelpers.h"
#include <QtCore/QString>

namespace XenCtl
{
    class CredentialCache;
    class RemoteShell;
    class SecretPrompt;

    struct XENCTL_EXPORT RunScriptOptions
    {
        QString script;       // local file sent to the guest
        QString command;      // used instead of script when not null
        QString user;         // ssh login
        int port = 0;
        QString password;     // null: cache, then prompt if needed
        bool askPassword = false;
        bool sudo = false;
        int ipWaitSeconds = VMHelpers::DEFAULT_IP_WAIT_SECONDS;
    };

    /**
     * @brief Run a script or command on a running guest over SSH
     *
     * Result: the exit code of the remote command.
     */
    class XENCTL_EXPORT RunScriptAction : public Operation
    {
        Q_OBJECT

        public:
            RunScriptAction(Session* session,
                            const QString& vm,
                            const RunScriptOptions& options,
                            RemoteShell* shell,
                            SecretPrompt* prompt,
                            CredentialCache* credentials = nullptr,
                            QObject* parent = nullptr);

            int exitCode() const { return this->m_exitCode; }

        protected:
            void run() override;

        private:
            QString resolvePassword();

            QString m_vm;
            RunScriptOptions m_options;
            RemoteShell* m_shell;
            SecretPrompt* m_prompt;
            CredentialCache* m_credentials;
            int m_exitCode;
    };
}

#endif // XENCTL_RUNSCRIPTACTION_H
