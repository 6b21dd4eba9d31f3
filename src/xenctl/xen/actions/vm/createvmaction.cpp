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

#include "createvmaction.h"
#include "../../failure.h"
#include "../../session.h"
#include "../../xenapi/xenapi_VM.h"
#include "../../../utils/misc.h"
#include <QtCore/QDebug>
#include <QtCore/QList>
#include <QtCore/QPair>
#include <functional>
#include <stdexcept>

namespace XenCtl
{
    CreateVmAction::CreateVmAction(Session* session,
                                   const QString& vmName,
                                   const QString& templateName,
                                   int cpus,
                                   const QString& memory,
                                   int ipWaitSeconds,
                                   QObject* parent)
        : Operation(session, "Create VM", QString("Creating '%1'").arg(vmName), parent)
        , m_vmName(vmName)
        , m_templateName(templateName)
        , m_cpus(cpus)
        , m_memoryBytes(-1)
        , m_ipWaitSeconds(ipWaitSeconds)
    {
        if (templateName.isEmpty())
            throw std::invalid_argument("No template name given");
        if (vmName.isEmpty())
            throw std::invalid_argument("No VM name given");
        if (cpus < 0)
            throw std::invalid_argument("VCPU count cannot be negative");
        if (!memory.isEmpty())
            this->m_memoryBytes = Misc::ParseByteCount(memory);
    }

    void CreateVmAction::run()
    {
        Session* session = this->session();

        const QString templateRef = VMHelpers::FindTemplate(session, this->m_templateName, true);

        this->setDescription(QString("Cloning template %1").arg(this->m_templateName));
        const QString vmRef = API::VM::clone(session, templateRef, this->m_vmName);
        this->setResult(vmRef);

        if (this->m_cpus > 0)
        {
            API::VM::set_VCPUs_max(session, vmRef, this->m_cpus);
            API::VM::set_VCPUs_at_startup(session, vmRef, this->m_cpus);
        }

        if (this->m_memoryBytes >= 0)
            this->setMemory(vmRef);

        this->setDescription("Provisioning");
        API::VM::provision(session, vmRef);

        this->setDescription("Starting");
        API::VM::start(session, vmRef, false, true);

        if (this->m_ipWaitSeconds > 0)
        {
            this->setDescription("Waiting for IP address");
            this->m_ip = VMHelpers::WaitForIp(session, vmRef, this->m_ipWaitSeconds);
            if (this->m_ip.isEmpty())
                qWarning().noquote() << "No IP address for" << this->m_vmName << "after" << this->m_ipWaitSeconds << "seconds";
            else
                qInfo().noquote() << "IP address for" << this->m_vmName + ":" << this->m_ip;
        }

        this->setDescription("Created");
    }

    void CreateVmAction::setMemory(const QString& vmRef)
    {
        Session* session = this->session();
        const qint64 mem = this->m_memoryBytes;

        // set_memory_limits appeared in XenServer 5.6; older servers only have the single setters
        QList<QPair<QString, std::function<void()>>> variants;
        variants.append(qMakePair(QString("VM.set_memory_limits"), std::function<void()>([session, vmRef, mem]()
        {
            API::VM::set_memory_limits(session, vmRef, mem, mem, mem, mem);
        })));
        variants.append(qMakePair(QString("VM.set_memory_dynamic/static_min/max"), std::function<void()>([session, vmRef, mem]()
        {
            API::VM::set_memory_dynamic_min(session, vmRef, mem);
            API::VM::set_memory_dynamic_max(session, vmRef, mem);
            API::VM::set_memory_static_min(session, vmRef, mem);
            API::VM::set_memory_static_max(session, vmRef, mem);
        })));

        QStringList errors;
        for (const auto& variant : variants)
        {
            try
            {
                variant.second();
                return;
            } catch (const RemoteError& error)
            {
                qDebug() << "CreateVmAction:" << variant.first << "failed:" << error.message();
                errors.append(error.message());
            }
        }

        throw CompositeFailure(errors, QString("Could not set memory for %1:").arg(this->m_vmName));
    }
}
