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

#ifndef XENCTL_XENAPI_VM_H
#define XENCTL_XENAPI_VM_H

#include "../../xenctl_global.h"
#include <QtCore/QString>
#include <QtCore/QVariantMap>

namespace XenCtl
{
    class Session;

    namespace API
    {
        /**
         * @brief Static methods for XenAPI VM operations (XAPI object: VM)
         *
         * Only the calls used by the workflows are wrapped; anything else is
         * reachable through Session::Namespace("VM").
         */
        class XENCTL_EXPORT VM
        {
            private:
                VM() = delete;

            public:
                // Map of VM ref -> VM record, templates and control domains included
                static QVariantMap get_all_records(Session* session);
                static QVariantMap get_record(Session* session, const QString& vm);

                /**
                 * @brief Clone the VM, making a new VM. Clone automatically exploits the
                 * capabilities of the underlying storage repository.
                 * @return The ref of the newly created VM
                 */
                static QString clone(Session* session, const QString& vm, const QString& newName);

                /**
                 * @brief Inspect the disk configuration contained within the template
                 * and create VDIs and VBDs for it
                 */
                static void provision(Session* session, const QString& vm);

                static void start(Session* session, const QString& vm, bool start_paused, bool force);
                static void hard_shutdown(Session* session, const QString& vm);
                static void destroy(Session* session, const QString& vm);

                static void set_VCPUs_max(Session* session, const QString& vm, qint64 value);
                static void set_VCPUs_at_startup(Session* session, const QString& vm, qint64 value);

                // All four limits at once, available from XenServer 5.6
                static void set_memory_limits(Session* session, const QString& vm,
                                              qint64 static_min, qint64 static_max,
                                              qint64 dynamic_min, qint64 dynamic_max);
                static void set_memory_dynamic_min(Session* session, const QString& vm, qint64 value);
                static void set_memory_dynamic_max(Session* session, const QString& vm, qint64 value);
                static void set_memory_static_min(Session* session, const QString& vm, qint64 value);
                static void set_memory_static_max(Session* session, const QString& vm, qint64 value);

                static void set_is_a_template(Session* session, const QString& vm, bool value);

                static QString get_guest_metrics(Session* session, const QString& vm);
        };

        class XENCTL_EXPORT VM_guest_metrics
        {
            private:
                VM_guest_metrics() = delete;

            public:
                // Map of "<device>/ip" -> address, as reported by the guest agent
                static QVariantMap get_networks(Session* session, const QString& metrics);
        };
    }
}

#endif // XENCTL_XENAPI_VM_H
