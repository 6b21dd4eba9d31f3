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

#include "httprpctransport.h"
#include "httpclient.h"
#include "../failure.h"
#include <QtCore/QBuffer>
#include <QtCore/QDebug>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QSharedPointer>
#include <QtNetwork/QAbstractSocket>

namespace XenCtl
{
    class HttpRpcTransport::Private
    {
        public:
            QUrl uri;
            int timeoutMs = HttpRpcTransport::DEFAULT_TIMEOUT_MS;
            QMutex mutex;
            QSharedPointer<QAbstractSocket> socket;
    };

    HttpRpcTransport::HttpRpcTransport(const QUrl& uri, int timeoutMs) : d(new Private())
    {
        this->d->uri = uri;
        this->d->timeoutMs = timeoutMs;
    }

    HttpRpcTransport::~HttpRpcTransport()
    {
        if (this->d->socket)
            this->d->socket->abort();
        delete this->d;
    }

    QUrl HttpRpcTransport::GetUri() const
    {
        return this->d->uri;
    }

    QByteArray HttpRpcTransport::Post(const QByteArray& requestBody)
    {
        QMutexLocker locker(&this->d->mutex);

        if (!this->d->socket || this->d->socket->state() != QAbstractSocket::ConnectedState)
            this->d->socket = HttpClient::ConnectToHost(this->d->uri, this->d->timeoutMs);

        QAbstractSocket* socket = this->d->socket.data();

        try
        {
            QMap<QString, QString> headers;
            headers.insert("Content-Type", "text/xml");
            headers.insert("Connection", "keep-alive");
            HttpClient::SendRequestHead(socket, "POST", this->d->uri, requestBody.size(), headers, this->d->timeoutMs);

            if (socket->write(requestBody) != requestBody.size())
                throw TransportError(QString("Failed to send request: %1").arg(socket->errorString()));
            while (socket->bytesToWrite() > 0)
            {
                if (!socket->waitForBytesWritten(this->d->timeoutMs))
                    throw TransportError(QString("Failed to send request: %1").arg(socket->errorString()));
            }

            const HttpResponseHead head = HttpClient::ReadResponseHead(socket, this->d->timeoutMs);

            QByteArray body;
            QBuffer buffer(&body);
            buffer.open(QIODevice::WriteOnly);
            HttpClient::CopyStream(socket, &buffer, head.contentLength(), this->d->timeoutMs);
            buffer.close();

            if (head.contentLength() < 0 || head.headers.value("connection").compare("close", Qt::CaseInsensitive) == 0)
                this->d->socket.clear();

            if (head.statusCode != 200)
            {
                throw TransportError(QString("RPC endpoint %1 returned HTTP status code: %2")
                                         .arg(this->d->uri.toString()).arg(head.statusCode),
                                     head.statusCode);
            }

            return body;
        } catch (const TransportError&)
        {
            // Never reuse a connection in an unknown state
            qWarning() << "HttpRpcTransport: dropping connection to" << this->d->uri.host();
            this->d->socket.clear();
            throw;
        }
    }
}
