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

#ifndef XENCTL_OPERATION_H
#define XENCTL_OPERATION_H

#include "../xenctl_global.h"
#include "taskworkflow.h"
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace XenCtl
{
    class Session;

    /**
     * @brief Base class of the multi step workflows
     *
     * Subclasses implement run(); RunSync() executes it on the calling
     * thread, records the outcome and lets any error propagate.
     */
    class XENCTL_EXPORT Operation : public QObject
    {
        Q_OBJECT
        public:
            enum OperationState
            {
                NotStarted,
                Running,
                Completed,
                Failed
            };
            Q_ENUM(OperationState)

            Operation(Session* session, const QString& title, const QString& description = QString(),
                      QObject* parent = nullptr);
            ~Operation() override;

            QString title() const { return this->m_title; }
            QString description() const { return this->m_description; }
            void setDescription(const QString& description);

            Session* session() const { return this->m_session; }

            OperationState state() const { return this->m_state; }
            QString errorMessage() const { return this->m_errorMessage; }
            QStringList errorDetails() const { return this->m_errorDetails; }

            QString result() const { return this->m_result; }

            const PollOptions& pollOptions() const { return this->m_pollOptions; }
            void setPollOptions(const PollOptions& options) { this->m_pollOptions = options; }

            /**
             * @brief Run the operation to completion
             * @throws whatever run() throws, after recording it
             */
            void RunSync();

        signals:
            void started();
            void completed();
            void failed(const QString& error);
            void descriptionChanged(const QString& description);

        protected:
            virtual void run() = 0;

            void setResult(const QString& result) { this->m_result = result; }

        private:
            Session* m_session;
            QString m_title;
            QString m_description;
            OperationState m_state;
            QString m_errorMessage;
            QStringList m_errorDetails;
            QString m_result;
            PollOptions m_pollOptions;
    };
}

#endif // XENCTL_OPERATION_H
