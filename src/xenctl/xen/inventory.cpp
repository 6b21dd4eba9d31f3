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

#include "inventory.h"
#include "session.h"
#include "vmhelpers.h"
#include "xenapi/xenapi_Host.h"
#include "xenapi/xenapi_VM.h"
#include "../utils/misc.h"
#include <algorithm>

namespace XenCtl
{
    namespace
    {
        template <typename T>
        void sortByName(QList<T>& list)
        {
            std::sort(list.begin(), list.end(), [](const T& a, const T& b)
            {
                return Misc::NaturalCompare(a.name, b.name) < 0;
            });
        }
    }

    Inventory::Inventory(Session* session) : m_session(session)
    {
    }

    QList<VmSummary> Inventory::ListVms(int ipWaitSeconds)
    {
        QList<VmSummary> result;
        const QVariantMap vms = API::VM::get_all_records(this->m_session);

        for (auto it = vms.constBegin(); it != vms.constEnd(); ++it)
        {
            const QVariantMap record = it.value().toMap();
            if (VMHelpers::IsTemplate(record))
                continue;

            VmSummary summary;
            summary.name = record.value("name_label").toString();
            summary.uuid = record.value("uuid").toString();
            summary.ref = it.key();
            summary.powerState = record.value("power_state").toString();
            if (summary.powerState == "Running")
                summary.ip = VMHelpers::WaitForIp(this->m_session, it.key(), ipWaitSeconds);
            result.append(summary);
        }

        sortByName(result);
        return result;
    }

    QList<TemplateSummary> Inventory::ListTemplates(bool withDisksOnly)
    {
        QList<TemplateSummary> result;
        const QVariantMap vms = API::VM::get_all_records(this->m_session);

        for (auto it = vms.constBegin(); it != vms.constEnd(); ++it)
        {
            const QVariantMap record = it.value().toMap();
            if (!VMHelpers::IsTemplate(record) || (withDisksOnly && !VMHelpers::HasDisks(record)))
                continue;

            TemplateSummary summary;
            summary.name = record.value("name_label").toString();
            summary.uuid = record.value("uuid").toString();
            summary.ref = it.key();
            result.append(summary);
        }

        sortByName(result);
        return result;
    }

    QList<HostSummary> Inventory::ListHosts()
    {
        QList<HostSummary> result;
        const QVariantMap hosts = API::Host::get_all_records(this->m_session);
        const QVariantMap cpus = API::Host_cpu::get_all_records(this->m_session);

        for (auto it = hosts.constBegin(); it != hosts.constEnd(); ++it)
        {
            const QVariantMap record = it.value().toMap();

            HostSummary summary;
            summary.name = record.value("name_label").toString();
            summary.uuid = record.value("uuid").toString();
            summary.ref = it.key();

            summary.cpus = record.value("host_CPUs").toList().size();
            if (summary.cpus == 0)
            {
                for (const QVariant& cpu : cpus)
                {
                    if (cpu.toMap().value("host").toString() == it.key())
                        ++summary.cpus;
                }
            }

            const QString metrics = record.value("metrics").toString();
            if (!metrics.isEmpty())
                summary.metrics = API::Host_metrics::get_record(this->m_session, metrics);
            summary.memoryFree = Misc::FormatBytesIec(summary.metrics.value("memory_free").toLongLong());
            summary.memoryTotal = Misc::FormatBytesIec(summary.metrics.value("memory_total").toLongLong());

            result.append(summary);
        }

        sortByName(result);
        return result;
    }
}
