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

#ifndef XENCTL_IMPORTVMACTION_H
#define XENCTL_IMPORTVMACTION_H

#include "../../operation.h"
#include <QtCore/QString>

namespace XenCtl
{
    /**
     * @brief Import a VM from an XVA file
     *
     * HTTP PUT of the file to /import under a client created task.
     * Result: the task result (normally the ref of the imported VM).
     */
    class XENCTL_EXPORT ImportVmAction : public Operation
    {
        Q_OBJECT

        public:
            /**
             * @param filename Local XVA file path
             * @param sr Target SR name, uuid or ref; empty for the pool default
             */
            ImportVmAction(Session* session, const QString& filename, const QString& sr = QString(),
                           QObject* parent = nullptr);

        signals:
            void bytesTransferred(qint64 bytes);

        protected:
            void run() override;

        private:
            QString m_filename;
            QString m_sr;
    };
}

#endif // XENCTL_IMPORTVMACTION_H
