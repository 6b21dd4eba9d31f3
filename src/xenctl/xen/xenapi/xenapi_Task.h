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

#ifndef XENCTL_XENAPI_TASK_H
#define XENCTL_XENAPI_TASK_H

#include "../../xenctl_global.h"
#include <QtCore/QString>
#include <QtCore/QVariantMap>

namespace XenCtl
{
    class Session;

    namespace API
    {
        /**
         * @brief Static methods for XenAPI task operations (XAPI object: task)
         */
        class XENCTL_EXPORT Task
        {
            private:
                Task() = delete;

            public:
                /**
                 * @brief Create a new task object
                 * @param session The session
                 * @param label Short label for the new task
                 * @param description Longer description for the new task
                 * @return Reference to the created task
                 */
                static QString create(Session* session, const QString& label, const QString& description);

                static QVariantMap get_record(Session* session, const QString& task);

                /**
                 * @brief Destroy the task object
                 *
                 * Tasks created by the client are never garbage collected by the server.
                 */
                static void destroy(Session* session, const QString& task);

                static void cancel(Session* session, const QString& task);
        };
    }
}

#endif // XENCTL_XENAPI_TASK_H
