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

#include "api.h"
#include "failure.h"
#include "xmlrpcclient.h"
#include "network/rpctransport.h"
#include <QtCore/QDebug>

namespace XenCtl
{
    RpcGateway::RpcGateway(const QSharedPointer<RpcTransport>& transport, const QString& endpoint)
        : m_transport(transport), m_endpoint(endpoint)
    {
    }

    QVariant RpcGateway::CallRaw(const QString& method, const RpcValueList& args)
    {
        const QByteArray request = XmlRpcClient::BuildMethodCall(method, args);
        const QByteArray response = this->m_transport->Post(request);
        return XmlRpcClient::ParseMethodResponse(response, method);
    }

    QVariant RpcGateway::Call(const QString& method, const RpcValueList& args)
    {
        return UnwrapEnvelope(this->CallRaw(method, args), method, this->m_endpoint);
    }

    QVariant RpcGateway::UnwrapEnvelope(const QVariant& response, const QString& method, const QString& endpoint)
    {
        const QVariantMap envelope = response.toMap();
        if (!envelope.contains("Status"))
            throw TransportError(QString("Response to %1 carries no Status field").arg(method));

        const QString status = envelope.value("Status").toString();
        if (status == "Success")
            return envelope.value("Value");

        QStringList errorDescription;
        const QVariantList description = envelope.value("ErrorDescription").toList();
        for (const QVariant& item : description)
            errorDescription.append(item.toString());

        qDebug() << "RpcGateway:" << method << "returned" << status << errorDescription;
        throw RemoteError(method, status, errorDescription, endpoint);
    }
}
