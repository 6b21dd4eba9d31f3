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

#include "importvmaction.h"
#include "../../failure.h"
#include "../../session.h"
#include "../../taskworkflow.h"
#include "../../vmhelpers.h"
#include "../../network/httpclient.h"
#include <QtCore/QFileInfo>
#include <stdexcept>

namespace XenCtl
{
    ImportVmAction::ImportVmAction(Session* session, const QString& filename, const QString& sr, QObject* parent)
        : Operation(session, "Import VM", QString("Importing '%1'").arg(filename), parent)
        , m_filename(filename)
        , m_sr(sr)
    {
        if (filename.isEmpty())
            throw std::invalid_argument("No file name given");
    }

    void ImportVmAction::run()
    {
        Session* session = this->session();

        if (!QFileInfo(this->m_filename).isReadable())
            throw Failure(QString("Could not open %1 for reading").arg(this->m_filename));

        QString srUuid;
        if (!this->m_sr.isEmpty())
            srUuid = VMHelpers::FindSrUuid(session, this->m_sr);

        TaskWorkflow workflow(session, this->pollOptions());
        const TaskRecord record = workflow.Run(
            "import_" + this->m_filename, "Import VM " + this->m_filename, "Import",
            [this, session, &srUuid](const QString& taskRef)
            {
                const QUrl uri = HttpClient::BuildUri(session->GetUri(), "import", QueryParams()
                                                      << qMakePair(QString("session_id"), session->GetSessionId())
                                                      << qMakePair(QString("task_id"), taskRef)
                                                      << qMakePair(QString("sr_uuid"), srUuid));

                this->setDescription("Uploading");
                HttpClient client;
                client.SetDataCopiedCallback([this](qint64 bytes) { emit this->bytesTransferred(bytes); });
                client.PutFile(uri, this->m_filename);
                this->setDescription("Waiting for import to finish");
            });

        this->setResult(TaskRecord::StripValueTags(record.GetResult()));
        this->setDescription("Imported");
    }
}
