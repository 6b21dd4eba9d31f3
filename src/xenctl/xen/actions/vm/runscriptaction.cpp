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

#include "runscriptaction.h"
#include "../../failure.h"
#include "../../lookup.h"
#include "../../session.h"
#include "../../xenapi/xenapi_VM.h"
#include "../../../utils/remoteshell.h"
#include "../../../utils/secretprompt.h"
#include <QtCore/QFile>
#include <stdexcept>

namespace XenCtl
{
    RunScriptAction::RunScriptAction(Session* session,
                                     const QString& vm,
                                     const RunScriptOptions& options,
                                     RemoteShell* shell,
                                     SecretPrompt* prompt,
                                     CredentialCache* credentials,
                                     QObject* parent)
        : Operation(session, "Run script", QString("Running script on '%1'").arg(vm), parent)
        , m_vm(vm)
        , m_options(options)
        , m_shell(shell)
        , m_prompt(prompt)
        , m_credentials(credentials)
        , m_exitCode(-1)
    {
        if (vm.isEmpty())
            throw std::invalid_argument("No VM name given");
        if (options.command.isNull() && options.script.isNull())
            throw std::invalid_argument("No command or script was given");
        if (!shell)
            throw std::invalid_argument("Remote shell cannot be null");
    }

    QString RunScriptAction::resolvePassword()
    {
        QString password = this->m_options.password;
        if (password.isNull() && this->m_credentials && this->m_credentials->HasPassword())
            password = this->m_credentials->Password();

        if ((this->m_options.askPassword || this->m_options.sudo) && password.isNull())
        {
            if (!this->m_prompt)
                throw Failure("A password is required but no prompt is available");
            password = this->m_prompt->ReadSecret("Enter login password: ");
            if (password.isNull())
                throw Failure("No password given");
        }

        if (this->m_credentials && !password.isNull())
            this->m_credentials->Store(password);
        return password;
    }

    void RunScriptAction::run()
    {
        Session* session = this->session();

        const QVariantMap vms = API::VM::get_all_records(session);
        const QString vmRef = RecordLookup::FindUnique(vms, this->m_vm, "VM");
        if (vms.value(vmRef).toMap().value("power_state").toString() != "Running")
            throw Failure(QString("VM %1 is not running").arg(this->m_vm));

        RemoteCommand command;
        command.password = this->resolvePassword();
        command.user = this->m_options.user;
        command.port = this->m_options.port;
        command.sudo = this->m_options.sudo;

        this->setDescription("Waiting for IP address");
        command.host = VMHelpers::WaitForIp(session, vmRef, this->m_options.ipWaitSeconds);
        if (command.host.isEmpty())
            throw TimeoutError(QString("Could not determine IP address of %1").arg(this->m_vm), vmRef);

        command.command = this->m_options.command;
        if (command.command.isNull())
        {
            QFile file(this->m_options.script);
            if (!file.open(QIODevice::ReadOnly))
                throw Failure(QString("Could not read script file %1").arg(this->m_options.script));
            command.command = QString::fromUtf8(file.readAll());
        }

        this->setDescription(QString("Running on %1").arg(command.host));
        this->m_exitCode = this->m_shell->Execute(command);
        this->setResult(QString::number(this->m_exitCode));
    }
}
