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

#include "taskworkflow.h"
#include "failure.h"
#include "session.h"
#include "xenapi/xenapi_Task.h"
#include <QtCore/QDebug>
#include <QtCore/QThread>
#include <exception>

namespace XenCtl
{
    const int PollOptions::DEFAULT_INTERVAL_MS;
    const int PollOptions::DEFAULT_MAX_ATTEMPTS;

    namespace
    {
        QString unsuccessfulText(const QString& what, const TaskRecord& record, int maxAttempts)
        {
            if (record.IsTimedOut())
            {
                return QString("%1 task %2 still pending after %3 polls")
                    .arg(what, record.GetRef()).arg(maxAttempts);
            }
            return TaskFailure(what, record.GetRef(), record.GetStatusText(), record.GetErrorInfo()).message();
        }
    }

    TaskWorkflow::TaskWorkflow(Session* session, const PollOptions& options)
        : m_session(session), m_options(options)
    {
    }

    QString TaskWorkflow::CreateTask(const QString& label, const QString& description)
    {
        const QString taskRef = API::Task::create(this->m_session, label, description);
        qDebug() << "TaskWorkflow: created task" << taskRef << label << "on" << this->m_session->GetHost();
        return taskRef;
    }

    TaskRecord TaskWorkflow::GetRecord(const QString& taskRef)
    {
        return TaskRecord(taskRef, API::Task::get_record(this->m_session, taskRef));
    }

    TaskRecord TaskWorkflow::PollUntilTerminal(const QString& taskRef)
    {
        TaskRecord record;
        const int maxAttempts = qMax(1, this->m_options.maxAttempts);

        for (int attempt = 1; attempt <= maxAttempts; ++attempt)
        {
            record = this->GetRecord(taskRef);
            if (!record.IsPending())
            {
                qDebug() << "TaskWorkflow: task" << taskRef << record.GetStatusText() << "after" << attempt << "polls";
                return record;
            }
            if (attempt < maxAttempts)
                QThread::msleep(this->m_options.intervalMs);
        }

        qWarning() << "TaskWorkflow: task" << taskRef << "still pending after" << maxAttempts << "polls";
        record.SetTimedOut(true);
        return record;
    }

    void TaskWorkflow::DestroyTask(const QString& taskRef)
    {
        API::Task::destroy(this->m_session, taskRef);
        qDebug() << "TaskWorkflow: destroyed task" << taskRef;
    }

    TaskRecord TaskWorkflow::Run(const QString& label, const QString& description, const QString& what, Action action)
    {
        const QString taskRef = this->CreateTask(label, description);
        std::exception_ptr error;

        try
        {
            action(taskRef);
        } catch (const std::exception& exception)
        {
            qWarning() << "TaskWorkflow:" << what << "failed:" << exception.what();
            error = std::current_exception();
        }

        TaskRecord record;
        try
        {
            record = this->PollUntilTerminal(taskRef);
            if (error && !record.IsSuccess())
                qWarning() << "TaskWorkflow:" << what << "task" << taskRef << "ended" << record.GetStatusText() << record.GetErrorInfo();
        } catch (const Failure& failure)
        {
            if (!error)
                error = std::current_exception();
            else
                qWarning() << "TaskWorkflow: polling" << taskRef << "failed:" << failure.message();
        }

        try
        {
            this->DestroyTask(taskRef);
        } catch (const Failure& failure)
        {
            if (!error)
                error = std::current_exception();
            else
                qWarning() << "TaskWorkflow: destroying" << taskRef << "failed:" << failure.message();
        }

        if (error)
            std::rethrow_exception(error);

        if (record.IsTimedOut())
            throw TimeoutError(unsuccessfulText(what, record, this->m_options.maxAttempts), taskRef);
        if (!record.IsSuccess())
            throw TaskFailure(what, taskRef, record.GetStatusText(), record.GetErrorInfo());

        return record;
    }

    void TaskWorkflow::RunPair(TaskWorkflow& source, const TaskSpec& sourceSpec,
                               TaskWorkflow& destination, const TaskSpec& destinationSpec,
                               PairAction action)
    {
        const QString sourceTask = source.CreateTask(sourceSpec.label, sourceSpec.description);

        QString destinationTask;
        try
        {
            destinationTask = destination.CreateTask(destinationSpec.label, destinationSpec.description);
        } catch (const Failure&)
        {
            try
            {
                source.DestroyTask(sourceTask);
            } catch (const Failure& failure)
            {
                qWarning() << "TaskWorkflow: destroying" << sourceTask << "failed:" << failure.message();
            }
            throw;
        }

        QStringList errors;

        try
        {
            action(sourceTask, destinationTask);
        } catch (const Failure& failure)
        {
            errors.append(failure.message());
        } catch (const std::exception& exception)
        {
            errors.append(QString::fromLocal8Bit(exception.what()));
        }
        if (!errors.isEmpty())
            qWarning() << "TaskWorkflow: relay failed:" << errors.last();

        struct Side
        {
            TaskWorkflow* workflow;
            QString taskRef;
            QString what;
            bool done;
        };
        Side sides[] = {
            {&source, sourceTask, sourceSpec.what, false},
            {&destination, destinationTask, destinationSpec.what, false}
        };

        // Both tasks are polled in the same rounds, each up to its own maxAttempts
        const int rounds = qMax(1, qMax(source.m_options.maxAttempts, destination.m_options.maxAttempts));
        const int intervalMs = qMin(source.m_options.intervalMs, destination.m_options.intervalMs);

        for (int attempt = 1; attempt <= rounds; ++attempt)
        {
            bool pending = false;
            for (Side& side : sides)
            {
                if (side.done)
                    continue;

                const int maxAttempts = qMax(1, side.workflow->m_options.maxAttempts);
                try
                {
                    TaskRecord record = side.workflow->GetRecord(side.taskRef);
                    if (!record.IsPending())
                    {
                        side.done = true;
                        qDebug() << "TaskWorkflow: task" << side.taskRef << record.GetStatusText() << "after" << attempt << "polls";
                        if (!record.IsSuccess())
                            errors.append(unsuccessfulText(side.what, record, maxAttempts));
                    } else if (attempt >= maxAttempts)
                    {
                        side.done = true;
                        qWarning() << "TaskWorkflow: task" << side.taskRef << "still pending after" << maxAttempts << "polls";
                        record.SetTimedOut(true);
                        errors.append(unsuccessfulText(side.what, record, maxAttempts));
                    }
                } catch (const Failure& failure)
                {
                    side.done = true;
                    errors.append(failure.message());
                }

                if (!side.done)
                    pending = true;
            }

            if (!pending)
                break;
            QThread::msleep(intervalMs);
        }

        for (const Side& side : sides)
        {
            try
            {
                side.workflow->DestroyTask(side.taskRef);
            } catch (const Failure& failure)
            {
                errors.append(failure.message());
            }
        }

        if (!errors.isEmpty())
            throw CompositeFailure(errors, "Transfer failed:");
    }
}
