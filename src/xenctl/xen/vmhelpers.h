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

#ifndef XENCTL_VMHELPERS_H
#define XENCTL_VMHELPERS_H

#include "../xenctl_global.h"
#include <QtCore/QString>
#include <QtCore/QVariantMap>

namespace XenCtl
{
    class Session;

    /**
     * @brief Helper functions for VM operations that need a live session
     */
    class XENCTL_EXPORT VMHelpers
    {
        public:
            static const int DEFAULT_IP_WAIT_SECONDS = 60;

            static bool IsTemplate(const QVariantMap& vmRecord);
            static bool HasDisks(const QVariantMap& vmRecord);

            // Any VM record, templates included
            static QString FindVm(Session* session, const QString& key);

            // Templates only; with disks only when withDisksOnly is set
            static QString FindTemplate(Session* session, const QString& key, bool withDisksOnly = true);

            // uuid of the matching storage repository
            static QString FindSrUuid(Session* session, const QString& key);

            /**
             * @brief Poll the guest agent for the address of the first interface
             *
             * One probe per second, maxWaitSeconds probes at most. Errors while
             * the guest metrics do not exist yet count as "no address".
             * @return The address of device 0, empty when none appeared
             */
            static QString WaitForIp(Session* session, const QString& vmRef, int maxWaitSeconds,
                                     int intervalMs = 1000);

            /**
             * @brief Resolve the VM by name, uuid or ref and wait for its address
             * @throws TimeoutError when no address appears in time
             */
            static QString GetIp(Session* session, const QString& vm, int maxWaitSeconds = DEFAULT_IP_WAIT_SECONDS);

        private:
            VMHelpers() = delete;
            ~VMHelpers() = delete;
    };
}

#endif // XENCTL_VMHELPERS_H
