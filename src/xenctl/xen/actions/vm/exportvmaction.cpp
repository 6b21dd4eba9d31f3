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

#include "exportvmaction.h"
#include "../../session.h"
#include "../../taskworkflow.h"
#include "../../vmhelpers.h"
#include "../../network/httpclient.h"
#include <stdexcept>

namespace XenCtl
{
    ExportVmAction::ExportVmAction(Session* session, const QString& vm, const QString& filename, QObject* parent)
        : Operation(session, "Export VM", QString("Exporting '%1'").arg(vm), parent)
        , m_vm(vm)
        , m_filename(filename)
    {
        if (vm.isEmpty())
            throw std::invalid_argument("No VM name given");
        if (filename.isEmpty())
            throw std::invalid_argument("No file name given");
    }

    void ExportVmAction::run()
    {
        Session* session = this->session();
        const QString vmRef = VMHelpers::FindVm(session, this->m_vm);

        TaskWorkflow workflow(session, this->pollOptions());
        workflow.Run("export_" + vmRef, "Export VM " + vmRef, "Export",
                     [this, session, &vmRef](const QString& taskRef)
                     {
                         const QUrl uri = HttpClient::BuildUri(session->GetUri(), "export", QueryParams()
                                                               << qMakePair(QString("session_id"), session->GetSessionId())
                                                               << qMakePair(QString("task_id"), taskRef)
                                                               << qMakePair(QString("ref"), vmRef));

                         this->setDescription("Downloading");
                         HttpClient client;
                         client.SetDataCopiedCallback([this](qint64 bytes) { emit this->bytesTransferred(bytes); });
                         client.GetFile(uri, this->m_filename);
                     });

        this->setResult(this->m_filename);
        this->setDescription("Exported");
    }
}
