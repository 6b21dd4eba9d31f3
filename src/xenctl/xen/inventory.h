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

#ifndef XENCTL_INVENTORY_H
#define XENCTL_INVENTORY_H

#include "../xenctl_global.h"
#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QVariantMap>

namespace XenCtl
{
    class Session;

    struct XENCTL_EXPORT VmSummary
    {
        QString name;
        QString uuid;
        QString ref;
        QString powerState;
        QString ip; // only probed for running VMs
    };

    struct XENCTL_EXPORT TemplateSummary
    {
        QString name;
        QString uuid;
        QString ref;
    };

    struct XENCTL_EXPORT HostSummary
    {
        QString name;
        QString uuid;
        QString ref;
        int cpus = 0;
        QVariantMap metrics;  // host_metrics record
        QString memoryFree;   // IEC formatted
        QString memoryTotal;
    };

    /**
     * @brief Listings of the pool content, sorted by name in natural order
     */
    class XENCTL_EXPORT Inventory
    {
        public:
            explicit Inventory(Session* session);

            // Non-template VMs; running ones get one address probe of ipWaitSeconds
            QList<VmSummary> ListVms(int ipWaitSeconds = 1);
            QList<TemplateSummary> ListTemplates(bool withDisksOnly = false);
            QList<HostSummary> ListHosts();

        private:
            Session* m_session;
    };
}

#endif // XENCTL_INVENTORY_H
