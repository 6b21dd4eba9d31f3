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

#include "failure.h"

namespace XenCtl
{
    const char* const Failure::HANDLE_INVALID = "HANDLE_INVALID";
    const char* const Failure::SESSION_AUTHENTICATION_FAILED = "SESSION_AUTHENTICATION_FAILED";
    const char* const Failure::SESSION_INVALID = "SESSION_INVALID";
    const char* const Failure::MESSAGE_METHOD_UNKNOWN = "MESSAGE_METHOD_UNKNOWN";
    const char* const Failure::MESSAGE_PARAMETER_COUNT_MISMATCH = "MESSAGE_PARAMETER_COUNT_MISMATCH";

    Failure::Failure(const QString& message, const QStringList& errorDescription)
        : std::runtime_error(message.toStdString())
        , m_message(message)
        , m_errorDescription(errorDescription)
    {
    }

    QString Failure::errorCode() const
    {
        return this->m_errorDescription.isEmpty() ? QString() : this->m_errorDescription.first();
    }

    namespace
    {
        QString remoteErrorText(const QString& method, const QString& status,
                                const QStringList& errorDescription, const QString& endpoint)
        {
            QString text = QString("Received status \"%1\"").arg(status);
            if (!endpoint.isEmpty())
                text += QString(" from xen server at %1").arg(endpoint);
            if (!method.isEmpty())
                text += QString(" calling %1").arg(method);
            return text + ": " + errorDescription.join(", ");
        }
    }

    RemoteError::RemoteError(const QString& method, const QString& status,
                             const QStringList& errorDescription, const QString& endpoint)
        : Failure(remoteErrorText(method, status, errorDescription, endpoint), errorDescription)
        , m_method(method)
        , m_status(status)
    {
    }

    RemoteError::RemoteError(const QStringList& errorDescription, const QString& message,
                             const QString& method, const QString& status)
        : Failure(message, errorDescription)
        , m_method(method)
        , m_status(status)
    {
    }

    AuthError::AuthError(const QString& endpoint, const QString& username, const QString& status,
                         const QStringList& errorDescription)
        : RemoteError(errorDescription,
                      QString("Login as %1 to %2 failed with status \"%3\": %4")
                          .arg(username, endpoint, status, errorDescription.join(", ")),
                      "session.login_with_password", status)
    {
    }

    namespace
    {
        QString lookupErrorText(const QString& kind, const QString& key, const QStringList& candidates)
        {
            if (candidates.isEmpty())
                return QString("No %1 named \"%2\"").arg(kind, key);
            return QString("Multiple %1s found matching \"%2\": %3").arg(kind, key, candidates.join(", "));
        }
    }

    LookupError::LookupError(const QString& kind, const QString& key, const QStringList& candidates)
        : Failure(lookupErrorText(kind, key, candidates))
        , m_kind(kind)
        , m_key(key)
        , m_candidates(candidates)
    {
    }

    TransportError::TransportError(const QString& message, int httpStatus)
        : Failure(message)
        , m_httpStatus(httpStatus)
    {
    }

    TaskFailure::TaskFailure(const QString& what, const QString& taskRef, const QString& status,
                             const QStringList& errorInfo)
        : Failure(QString("%1 task returned status %2: %3").arg(what, status, errorInfo.join(", ")), errorInfo)
        , m_taskRef(taskRef)
        , m_status(status)
    {
    }

    TimeoutError::TimeoutError(const QString& message, const QString& subject)
        : Failure(message)
        , m_subject(subject)
    {
    }

    CompositeFailure::CompositeFailure(const QStringList& messages, const QString& heading)
        : Failure(heading.isEmpty() ? messages.join("\n") : heading + "\n" + messages.join("\n"))
        , m_messages(messages)
    {
    }
}
