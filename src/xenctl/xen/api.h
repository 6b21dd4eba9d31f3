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

#ifndef XENCTL_API_H
#define XENCTL_API_H

#include "../xenctl_global.h"
#include "rpcvalue.h"
#include <QtCore/QSharedPointer>
#include <QtCore/QString>
#include <QtCore/QVariant>

namespace XenCtl
{
    class RpcTransport;

    /**
     * @brief Synchronous XML-RPC call boundary
     *
     * One request, one response, no retries. Arguments go out exactly as
     * tagged by the caller.
     */
    class XENCTL_EXPORT RpcGateway
    {
        public:
            RpcGateway(const QSharedPointer<RpcTransport>& transport, const QString& endpoint);

            /**
             * @brief Call a method and return the decoded response as is
             *
             * Used for calls that are not wrapped in the xapi status envelope,
             * such as system.listMethods.
             */
            QVariant CallRaw(const QString& method, const RpcValueList& args = RpcValueList());

            /**
             * @brief Call a method and unwrap the {Status, Value, ErrorDescription} envelope
             * @return The Value member on success
             * @throws RemoteError carrying the server status verbatim otherwise
             */
            QVariant Call(const QString& method, const RpcValueList& args = RpcValueList());

            static QVariant UnwrapEnvelope(const QVariant& response, const QString& method,
                                           const QString& endpoint = QString());

            QString GetEndpoint() const { return this->m_endpoint; }

        private:
            QSharedPointer<RpcTransport> m_transport;
            QString m_endpoint;
    };
}

#endif // XENCTL_API_H
