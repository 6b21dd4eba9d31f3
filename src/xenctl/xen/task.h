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

#ifndef XENCTL_TASK_H
#define XENCTL_TASK_H

#include "../xenctl_global.h"
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariantMap>

namespace XenCtl
{
    /**
     * @brief Snapshot of a server side task record
     *
     * status follows the xapi task_status_type: pending, success, failure,
     * cancelling, cancelled. cancelling is not terminal.
     */
    class XENCTL_EXPORT TaskRecord
    {
        public:
            enum class Status
            {
                Unknown,
                Pending,
                Success,
                Failure,
                Cancelling,
                Cancelled
            };

            TaskRecord() {}
            TaskRecord(const QString& ref, const QVariantMap& record);

            static Status ParseStatus(const QString& status);

            // Task results come back as "<value>OpaqueRef:...</value>"
            static QString StripValueTags(const QString& result);

            QString GetRef() const { return this->m_ref; }
            Status GetStatus() const { return this->m_status; }
            QString GetStatusText() const { return this->m_statusText; }
            QString GetResult() const { return this->m_result; }
            QStringList GetErrorInfo() const { return this->m_errorInfo; }
            double GetProgress() const { return this->m_progress; }
            const QVariantMap& GetData() const { return this->m_data; }

            bool IsPending() const;
            bool IsSuccess() const { return this->m_status == Status::Success; }

            // Polling gave up while the task was still pending
            bool IsTimedOut() const { return this->m_timedOut; }
            void SetTimedOut(bool timedOut) { this->m_timedOut = timedOut; }

        private:
            QString m_ref;
            Status m_status = Status::Unknown;
            QString m_statusText;
            QString m_result;
            QStringList m_errorInfo;
            double m_progress = 0.0;
            QVariantMap m_data;
            bool m_timedOut = false;
    };
}

#endif // XENCTL_TASK_H
