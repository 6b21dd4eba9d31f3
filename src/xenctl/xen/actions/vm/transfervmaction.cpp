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

#include "transfervmaction.h"
#include "../../session.h"
#include "../../taskworkflow.h"
#include "../../vmhelpers.h"
#include "../../network/httpclient.h"
#include <stdexcept>

namespace XenCtl
{
    TransferVmAction::TransferVmAction(Session* session, const QString& vm, Session* destination,
                                       const QString& sr, QObject* parent)
        : Operation(session, "Transfer VM", QString("Transferring '%1'").arg(vm), parent)
        , m_vm(vm)
        , m_destination(destination)
        , m_sr(sr)
    {
        if (vm.isEmpty())
            throw std::invalid_argument("No VM name given");
        if (!destination)
            throw std::invalid_argument("Destination session cannot be null");
    }

    void TransferVmAction::run()
    {
        Session* source = this->session();
        Session* destination = this->m_destination;

        const QString vmRef = VMHelpers::FindVm(source, this->m_vm);

        QString srUuid;
        if (!this->m_sr.isEmpty())
            srUuid = VMHelpers::FindSrUuid(destination, this->m_sr);

        TaskWorkflow exportWorkflow(source, this->pollOptions());
        TaskWorkflow importWorkflow(destination, this->pollOptions());

        TaskSpec exportTask;
        exportTask.label = "export_" + vmRef;
        exportTask.description = "Export VM " + vmRef;
        exportTask.what = "Export";

        TaskSpec importTask;
        importTask.label = "import_" + vmRef;
        importTask.description = "Import VM " + vmRef;
        importTask.what = "Import";

        TaskWorkflow::RunPair(exportWorkflow, exportTask, importWorkflow, importTask,
            [this, source, destination, &vmRef, &srUuid](const QString& exportTaskRef, const QString& importTaskRef)
            {
                const QUrl exportUri = HttpClient::BuildUri(source->GetUri(), "export", QueryParams()
                                                            << qMakePair(QString("session_id"), source->GetSessionId())
                                                            << qMakePair(QString("task_id"), exportTaskRef)
                                                            << qMakePair(QString("ref"), vmRef));
                const QUrl importUri = HttpClient::BuildUri(destination->GetUri(), "import", QueryParams()
                                                            << qMakePair(QString("session_id"), destination->GetSessionId())
                                                            << qMakePair(QString("task_id"), importTaskRef)
                                                            << qMakePair(QString("sr_uuid"), srUuid));

                this->setDescription(QString("Copying to %1").arg(destination->GetHost()));
                HttpClient client;
                client.SetDataCopiedCallback([this](qint64 bytes) { emit this->bytesTransferred(bytes); });
                client.Relay(exportUri, importUri);
                this->setDescription("Waiting for transfer to finish");
            });

        this->setResult(vmRef);
        this->setDescription("Transferred");
    }
}
