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

#include "vmhelpers.h"
#include "failure.h"
#include "lookup.h"
#include "session.h"
#include "xenapi/xenapi_SR.h"
#include "xenapi/xenapi_VM.h"
#include "xenapi/xenapi_Helper.h"
#include <QtCore/QDebug>
#include <QtCore/QThread>

namespace XenCtl
{
    const int VMHelpers::DEFAULT_IP_WAIT_SECONDS;

    bool VMHelpers::IsTemplate(const QVariantMap& vmRecord)
    {
        return vmRecord.value("is_a_template").toBool();
    }

    bool VMHelpers::HasDisks(const QVariantMap& vmRecord)
    {
        return !vmRecord.value("VBDs").toList().isEmpty();
    }

    QString VMHelpers::FindVm(Session* session, const QString& key)
    {
        return RecordLookup::FindUnique(API::VM::get_all_records(session), key, "VM");
    }

    QString VMHelpers::FindTemplate(Session* session, const QString& key, bool withDisksOnly)
    {
        return RecordLookup::FindUnique(API::VM::get_all_records(session), key, "template",
                                        [withDisksOnly](const QString&, const QVariantMap& record)
                                        {
                                            return IsTemplate(record) && (!withDisksOnly || HasDisks(record));
                                        });
    }

    QString VMHelpers::FindSrUuid(Session* session, const QString& key)
    {
        const QVariantMap srs = API::SR::get_all_records(session);
        const QString ref = RecordLookup::FindUnique(srs, key, "storage repository");
        return srs.value(ref).toMap().value("uuid").toString();
    }

    QString VMHelpers::WaitForIp(Session* session, const QString& vmRef, int maxWaitSeconds, int intervalMs)
    {
        QString ip;
        for (int attempt = 1; attempt <= maxWaitSeconds && ip.isEmpty(); ++attempt)
        {
            try
            {
                const QString metrics = API::VM::get_guest_metrics(session, vmRef);
                if (!API::Helper::IsNullOrEmptyOpaqueRef(metrics))
                    ip = API::VM_guest_metrics::get_networks(session, metrics).value("0/ip").toString();
            } catch (const RemoteError& failure)
            {
                qDebug() << "VMHelpers: no guest metrics for" << vmRef << "yet:" << failure.errorCode();
            }

            if (ip.isEmpty() && attempt < maxWaitSeconds)
                QThread::msleep(intervalMs);
        }
        return ip;
    }

    QString VMHelpers::GetIp(Session* session, const QString& vm, int maxWaitSeconds)
    {
        const QString vmRef = FindVm(session, vm);
        const QString ip = WaitForIp(session, vmRef, maxWaitSeconds);
        if (ip.isEmpty())
            throw TimeoutError(QString("Could not get IP address of VM %1: timeout").arg(vm), vmRef);
        return ip;
    }
}
