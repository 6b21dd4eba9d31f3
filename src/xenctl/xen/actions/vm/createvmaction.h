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

#ifndef XENCTL_CREATEVMACTION_H
#define XENCTL_CREATEVMACTION_H

#include "../../operation.h"
#include "../../vmhelpers.h"
#include <QtCore/QString>

namespace XenCtl
{
    /**
     * @brief Create and start a VM from a template
     *
     * The template must be unique by name, uuid or ref among the templates
     * that carry at least one disk. Result: ref of the new VM.
     */
    class XENCTL_EXPORT CreateVmAction : public Operation
    {
        Q_OBJECT

        public:
            /**
             * @param cpus VCPU count, 0 keeps the template setting
             * @param memory Memory size such as "2G", empty keeps the template setting
             * @param ipWaitSeconds Seconds to wait for the guest address, 0 to skip
             */
            CreateVmAction(Session* session,
                           const QString& vmName,
                           const QString& templateName,
                           int cpus = 0,
                           const QString& memory = QString(),
                           int ipWaitSeconds = VMHelpers::DEFAULT_IP_WAIT_SECONDS,
                           QObject* parent = nullptr);

            QString vmRef() const { return this->result(); }
            QString ipAddress() const { return this->m_ip; }

        protected:
            void run() override;

        private:
            void setMemory(const QString& vmRef);

            QString m_vmName;
            QString m_templateName;
            int m_cpus;
            qint64 m_memoryBytes;
            int m_ipWaitSeconds;
            QString m_ip;
    };
}

#endif // XENCTL_CREATEVMACTION_H
