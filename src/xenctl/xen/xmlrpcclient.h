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

#ifndef XENCTL_XMLRPCCLIENT_H
#define XENCTL_XMLRPCCLIENT_H

#include "../xenctl_global.h"
#include "rpcvalue.h"
#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QVariant>

class QXmlStreamReader;
class QXmlStreamWriter;

namespace XenCtl
{
    /**
     * @brief XML-RPC encoding/decoding for the XenServer RPC endpoint
     *
     * Request format:
     * @code
     * <?xml version="1.0" encoding="UTF-8"?>
     * <methodCall>
     *   <methodName>VM.clone</methodName>
     *   <params>
     *     <param><value><string>OpaqueRef:session</string></value></param>
     *     ...
     *   </params>
     * </methodCall>
     * @endcode
     *
     * XenServer wraps every gated result in a struct envelope
     * {Status, Value | ErrorDescription}; this class does not look inside it,
     * see RpcGateway for that. Only protocol level <fault> responses are
     * turned into errors here.
     */
    class XENCTL_EXPORT XmlRpcClient
    {
        public:
            static QByteArray BuildMethodCall(const QString& method, const RpcValueList& params);

            /**
             * @brief Decode a methodResponse body
             * @param body Raw XML returned by the server
             * @param method Method name, only used in error messages
             * @return Decoded value (QVariantMap for structs, QVariantList for arrays)
             * @throws RemoteError with status "Fault" on an XML-RPC fault
             * @throws TransportError when the body is not a valid methodResponse
             */
            static QVariant ParseMethodResponse(const QByteArray& body, const QString& method = QString());

            /**
             * @brief Decode a methodCall body
             * @param body Raw XML of the call
             * @param method Receives the method name
             * @return The typed parameters in order
             */
            static RpcValueList ParseMethodCall(const QByteArray& body, QString* method);

            static QByteArray BuildMethodResponse(const RpcValue& value);
            static QByteArray BuildFaultResponse(int faultCode, const QString& faultString);

            static void WriteValue(QXmlStreamWriter& writer, const RpcValue& value);

            /**
             * @brief Read one <value> element
             *
             * The reader must be positioned on the <value> start element; it
             * is left on the matching end element. A value without a type
             * tag is a string, as required by the XML-RPC specification.
             */
            static RpcValue ReadValue(QXmlStreamReader& reader);

        private:
            XmlRpcClient() = delete;

            static RpcValue readTypedValue(QXmlStreamReader& reader);
            static void expectStartElement(QXmlStreamReader& reader, const char* name);
    };
}

#endif // XENCTL_XMLRPCCLIENT_H
