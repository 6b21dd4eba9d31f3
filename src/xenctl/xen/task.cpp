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

#include "task.h"
#include <QtCore/QRegularExpression>

namespace XenCtl
{
    TaskRecord::TaskRecord(const QString& ref, const QVariantMap& record)
        : m_ref(ref), m_data(record)
    {
        this->m_statusText = record.value("status").toString();
        this->m_status = ParseStatus(this->m_statusText);
        this->m_result = record.value("result").toString();
        this->m_progress = record.value("progress").toDouble();

        const QVariantList errorInfo = record.value("error_info").toList();
        for (const QVariant& item : errorInfo)
            this->m_errorInfo.append(item.toString());
    }

    TaskRecord::Status TaskRecord::ParseStatus(const QString& status)
    {
        const QString lower = status.toLower();
        if (lower == "pending")
            return Status::Pending;
        if (lower == "success")
            return Status::Success;
        if (lower == "failure")
            return Status::Failure;
        if (lower == "cancelling")
            return Status::Cancelling;
        if (lower == "cancelled")
            return Status::Cancelled;
        return Status::Unknown;
    }

    QString TaskRecord::StripValueTags(const QString& result)
    {
        static const QRegularExpression valueTags("^\\s*<value>(.*)</value>\\s*$",
                                                  QRegularExpression::DotMatchesEverythingOption);
        const QRegularExpressionMatch match = valueTags.match(result);
        return match.hasMatch() ? match.captured(1) : result;
    }

    bool TaskRecord::IsPending() const
    {
        return this->m_status == Status::Pending || this->m_status == Status::Cancelling;
    }
}
