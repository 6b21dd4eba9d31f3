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

#ifndef XENCTL_FAILURE_H
#define XENCTL_FAILURE_H

#include "../xenctl_global.h"
#include <QString>
#include <QStringList>
#include <stdexcept>
#include <string>

namespace XenCtl
{
    /*!
     * \brief Base class of every error raised by xenctl
     *
     * Carries the error description as reported by the server (or built
     * locally), the first element being the error code. Subclasses add the
     * context of the layer that raised them.
     */
    class XENCTL_EXPORT Failure : public std::runtime_error
    {
        public:
            // XenAPI error codes the client reacts to
            static const char* const HANDLE_INVALID;
            static const char* const SESSION_AUTHENTICATION_FAILED;
            static const char* const SESSION_INVALID;
            static const char* const MESSAGE_METHOD_UNKNOWN;
            static const char* const MESSAGE_PARAMETER_COUNT_MISMATCH;

            explicit Failure(const QString& message, const QStringList& errorDescription = QStringList());

            const QStringList& errorDescription() const { return this->m_errorDescription; }
            QString message() const { return this->m_message; }

            // First element of errorDescription
            QString errorCode() const;

        private:
            QString m_message;
            QStringList m_errorDescription;
    };

    /*!
     * \brief A gated call returned a non-success status, or an XML-RPC fault
     */
    class XENCTL_EXPORT RemoteError : public Failure
    {
        public:
            RemoteError(const QString& method, const QString& status, const QStringList& errorDescription,
                        const QString& endpoint = QString());

            QString method() const { return this->m_method; }
            QString status() const { return this->m_status; }

        protected:
            RemoteError(const QStringList& errorDescription, const QString& message,
                        const QString& method, const QString& status);

        private:
            QString m_method;
            QString m_status;
    };

    class XENCTL_EXPORT AuthError : public RemoteError
    {
        public:
            AuthError(const QString& endpoint, const QString& username, const QString& status,
                      const QStringList& errorDescription);
    };

    /*!
     * \brief Name/uuid/ref lookup matched zero or several records
     *
     * candidates() lists the matches formatted as "name" (uuid).
     */
    class XENCTL_EXPORT LookupError : public Failure
    {
        public:
            LookupError(const QString& kind, const QString& key, const QStringList& candidates = QStringList());

            QString kind() const { return this->m_kind; }
            QString key() const { return this->m_key; }
            const QStringList& candidates() const { return this->m_candidates; }

        private:
            QString m_kind;
            QString m_key;
            QStringList m_candidates;
    };

    class XENCTL_EXPORT TransportError : public Failure
    {
        public:
            explicit TransportError(const QString& message, int httpStatus = 0);

            // 0 when the failure happened below HTTP
            int httpStatus() const { return this->m_httpStatus; }

        private:
            int m_httpStatus;
    };

    /*!
     * \brief A polled task finished with a status other than success
     */
    class XENCTL_EXPORT TaskFailure : public Failure
    {
        public:
            TaskFailure(const QString& what, const QString& taskRef, const QString& status,
                        const QStringList& errorInfo);

            QString taskRef() const { return this->m_taskRef; }
            QString status() const { return this->m_status; }

        private:
            QString m_taskRef;
            QString m_status;
    };

    class XENCTL_EXPORT TimeoutError : public Failure
    {
        public:
            TimeoutError(const QString& message, const QString& subject);

            QString subject() const { return this->m_subject; }

        private:
            QString m_subject;
    };

    /*!
     * \brief Several independent failures reported together
     *
     * Used where a workflow must finish all of its steps (both sides of a
     * transfer, every memory API variant) before reporting.
     */
    class XENCTL_EXPORT CompositeFailure : public Failure
    {
        public:
            explicit CompositeFailure(const QStringList& messages, const QString& heading = QString());

            const QStringList& messages() const { return this->m_messages; }

        private:
            QStringList m_messages;
    };
}

#endif // XENCTL_FAILURE_H
