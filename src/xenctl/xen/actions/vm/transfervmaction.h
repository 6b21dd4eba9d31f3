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

#ifndef XENCTL_TRANSFERVMACTION_H
#define XENCTL_TRANSFERVMACTION_H

#include "../../operation.h"
#include <QtCore/QString>

namespace XenCtl
{
    /**
     * @brief Copy a VM from one server to another without an intermediate file
     *
     * The export of the source session is piped into an import on the
     * destination session. Each side runs under its own task; both are
     * polled and destroyed whatever happens, and all errors of both sides
     * are reported together.
     */
    class XENCTL_EXPORT TransferVmAction : public Operation
    {
        Q_OBJECT

        public:
            /**
             * @param session Source session
             * @param destination Destination session
             * @param sr SR name, uuid or ref on the destination; empty for its default
             */
            TransferVmAction(Session* session, const QString& vm, Session* destination,
                             const QString& sr = QString(), QObject* parent = nullptr);

        signals:
            void bytesTransferred(qint64 bytes);

        protected:
            void run() override;

        private:
            QString m_vm;
            Session* m_destination;
            QString m_sr;
    };
}

#endif // XENCTL_TRANSFERVMACTION_H
