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

#include "operation.h"
#include "failure.h"
#include <QtCore/QDebug>
#include <stdexcept>

namespace XenCtl
{
    Operation::Operation(Session* session, const QString& title, const QString& description, QObject* parent)
        : QObject(parent)
        , m_session(session)
        , m_title(title)
        , m_description(description)
        , m_state(NotStarted)
    {
    }

    Operation::~Operation()
    {
    }

    void Operation::setDescription(const QString& description)
    {
        if (this->m_description == description)
            return;
        this->m_description = description;
        qDebug().noquote() << this->m_title + ":" << description;
        emit this->descriptionChanged(description);
    }

    void Operation::RunSync()
    {
        if (this->m_state != NotStarted)
            throw std::logic_error("Operation already started");
        if (!this->m_session)
            throw std::invalid_argument("Operation needs a session");

        this->m_state = Running;
        emit this->started();

        try
        {
            this->run();
        } catch (const Failure& failure)
        {
            this->m_state = Failed;
            this->m_errorMessage = failure.message();
            this->m_errorDetails = failure.errorDescription();
            qWarning().noquote() << this->m_title << "failed:" << failure.message();
            emit this->failed(this->m_errorMessage);
            throw;
        } catch (const std::exception& e)
        {
            this->m_state = Failed;
            this->m_errorMessage = QString::fromLocal8Bit(e.what());
            qWarning().noquote() << this->m_title << "failed:" << this->m_errorMessage;
            emit this->failed(this->m_errorMessage);
            throw;
        }

        this->m_state = Completed;
        emit this->completed();
    }
}
