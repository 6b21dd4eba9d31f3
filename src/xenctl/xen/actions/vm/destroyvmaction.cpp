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

#include "destroyvmaction.h"
#include "../../lookup.h"
#include "../../session.h"
#include "../../xenapi/xenapi_Helper.h"
#include "../../xenapi/xenapi_VBD.h"
#include "../../xenapi/xenapi_VDI.h"
#include "../../xenapi/xenapi_VM.h"
#include <QtCore/QDebug>
#include <stdexcept>

namespace XenCtl
{
    DestroyVmAction::DestroyVmAction(Session* session, const QString& vm, QObject* parent)
        : Operation(session, "Destroy VM", QString("Destroying '%1'").arg(vm), parent)
        , m_vm(vm)
    {
        if (vm.isEmpty())
            throw std::invalid_argument("No VM name given");
    }

    void DestroyVmAction::run()
    {
        Session* session = this->session();

        const QVariantMap vms = API::VM::get_all_records(session);
        const QString vmRef = RecordLookup::FindUnique(vms, this->m_vm, "VM");
        const QVariantMap record = vms.value(vmRef).toMap();

        if (record.value("power_state").toString() != "Halted")
        {
            this->setDescription("Shutting down");
            API::VM::hard_shutdown(session, vmRef);
        }

        this->setDescription("Destroying disks");
        const QStringList vbds = API::Helper::RefListToStringArray(record.value("VBDs"));
        for (const QString& vbd : vbds)
        {
            const QVariantMap vbdRecord = API::VBD::get_record(session, vbd);
            const QString vdi = vbdRecord.value("VDI").toString();
            if (API::Helper::IsNullOrEmptyOpaqueRef(vdi) || vbdRecord.value("type").toString() == "CD")
                continue;
            qDebug() << "DestroyVmAction: destroying VDI" << vdi;
            API::VDI::destroy(session, vdi);
        }

        this->setDescription("Destroying VM");
        API::VM::destroy(session, vmRef);
        this->setResult(vmRef);
        this->setDescription("Destroyed");
    }
}
