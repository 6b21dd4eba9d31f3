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

#ifndef XENCTL_HTTPRPCTRANSPORT_H
#define XENCTL_HTTPRPCTRANSPORT_H

#include "rpctransport.h"
#include <QtCore/QUrl>

namespace XenCtl
{
    /**
     * @brief XML-RPC over HTTP/1.1 to the xapi endpoint
     *
     * One keep-alive connection is reused for all calls and reopened when the
     * server closes it. Calls are serialised, so the transport may be shared
     * between threads.
     */
    class XENCTL_EXPORT HttpRpcTransport : public RpcTransport
    {
        public:
            static const int DEFAULT_TIMEOUT_MS = 30 * 1000;

            explicit HttpRpcTransport(const QUrl& uri, int timeoutMs = DEFAULT_TIMEOUT_MS);
            ~HttpRpcTransport() override;

            QByteArray Post(const QByteArray& requestBody) override;

            QUrl GetUri() const;

        private:
            class Private;
            Private* d;

            HttpRpcTransport(const HttpRpcTransport&) = delete;
            HttpRpcTransport& operator=(const HttpRpcTransport&) = delete;
    };
}

#endif // XENCTL_HTTPRPCTRANSPORT_H
