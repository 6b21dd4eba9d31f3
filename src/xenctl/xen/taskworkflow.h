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

#ifndef XENCTL_TASKWORKFLOW_H
#define XENCTL_TASKWORKFLOW_H

#include "../xenctl_global.h"
#include "task.h"
#include <QtCore/QString>
#include <functional>

namespace XenCtl
{
    class Session;

    struct XENCTL_EXPORT PollOptions
    {
        static const int DEFAULT_INTERVAL_MS = 1000;
        static const int DEFAULT_MAX_ATTEMPTS = 60;

        int intervalMs = DEFAULT_INTERVAL_MS;
        int maxAttempts = DEFAULT_MAX_ATTEMPTS;
    };

    struct XENCTL_EXPORT TaskSpec
    {
        QString label;
        QString description;
        QString what; // "Export", "Import"
    };

    /**
     * @brief Life cycle of client created tasks: create, act, poll, destroy
     *
     * The task is destroyed whatever happens to the action or the polling.
     * Errors of the action are raised only once the task is gone.
     */
    class XENCTL_EXPORT TaskWorkflow
    {
        public:
            using Action = std::function<void(const QString& taskRef)>;
            using PairAction = std::function<void(const QString& sourceTaskRef, const QString& destinationTaskRef)>;

            explicit TaskWorkflow(Session* session, const PollOptions& options = PollOptions());

            QString CreateTask(const QString& label, const QString& description);
            TaskRecord GetRecord(const QString& taskRef);

            /**
             * @brief Fetch the task record until it leaves pending
             *
             * At most maxAttempts records are fetched, intervalMs apart. When
             * the task is still pending after the last one the record is
             * returned with IsTimedOut() set; this is not an error here.
             */
            TaskRecord PollUntilTerminal(const QString& taskRef);

            void DestroyTask(const QString& taskRef);

            /**
             * @brief Run action under a new task
             * @param what Name used in error messages, e.g. "Import"
             * @return The final task record (success)
             * @throws the action's own error, TimeoutError, or TaskFailure
             */
            TaskRecord Run(const QString& label, const QString& description, const QString& what, Action action);

            /**
             * @brief Run action under one task on each of two sessions
             *
             * Both tasks are polled in the same rounds and destroyed no
             * matter what failed; every problem found on either side is
             * reported in one CompositeFailure.
             */
            static void RunPair(TaskWorkflow& source, const TaskSpec& sourceTask,
                                TaskWorkflow& destination, const TaskSpec& destinationTask,
                                PairAction action);

            Session* GetSession() const { return this->m_session; }
            const PollOptions& GetPollOptions() const { return this->m_options; }

        private:
            Session* m_session;
            PollOptions m_options;
    };
}

#endif // XENCTL_TASKWORKFLOW_H
