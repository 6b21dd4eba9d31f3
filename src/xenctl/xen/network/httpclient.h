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

#ifndef XENCTL_HTTPCLIENT_H
#define XENCTL_HTTPCLIENT_H

#include "../../xenctl_global.h"
#include <QtCore/QList>
#include <QtCore/QMap>
#include <QtCore/QPair>
#include <QtCore/QSharedPointer>
#include <QtCore/QString>
#include <QtCore/QUrl>
#include <functional>

class QAbstractSocket;
class QIODevice;

namespace XenCtl
{
    struct XENCTL_EXPORT HttpResponseHead
    {
        int statusCode = 0;
        QString statusLine;
        QMap<QString, QString> headers; // lower-cased names

        // -1 when the response is delimited by connection close
        qint64 contentLength() const;
    };

    typedef QList<QPair<QString, QString>> QueryParams;

    /**
     * @brief HTTP client for the XenServer bulk-data endpoints (/import, /export)
     *
     * Every transfer is streamed through a fixed size buffer: a disk image is
     * never held in memory. Nothing is retried; any connection problem or a
     * status other than 200 raises TransportError.
     */
    class XENCTL_EXPORT HttpClient
    {
        public:
            using DataCopiedCallback = std::function<void(qint64 bytes)>;

            static const int BUFFER_SIZE = 32 * 1024;
            static const int CONNECT_TIMEOUT_MS = 30 * 1000;
            static const int HTTP_TIMEOUT_MS = 30 * 60 * 1000; // 30 minutes

            explicit HttpClient(int timeoutMs = HTTP_TIMEOUT_MS);

            void SetDataCopiedCallback(DataCopiedCallback callback) { this->dataCopiedCallback_ = callback; }

            /**
             * @brief Build a bulk-data URI from a session endpoint
             * @param base Session endpoint (scheme, host and port are kept)
             * @param path Operation path, e.g. "import"
             * @param queryParams Query items in order; items with an empty value are skipped
             */
            static QUrl BuildUri(const QUrl& base, const QString& path, const QueryParams& queryParams);

            /**
             * @brief Stream a local file into an HTTP PUT request body
             * @return Number of bytes sent
             */
            qint64 PutFile(const QUrl& uri, const QString& localFilePath);

            /**
             * @brief Stream an HTTP GET response body into a local file
             *
             * The body goes to "<file>.tmp" which is renamed once complete.
             * @return Number of bytes received
             */
            qint64 GetFile(const QUrl& uri, const QString& localFilePath);

            /**
             * @brief Pipe an export (GET) response straight into an import (PUT) request
             *
             * Both connections stay open for the whole copy.
             * @return Number of bytes relayed
             */
            qint64 Relay(const QUrl& exportUri, const QUrl& importUri);

            // Shared with the RPC transport
            static QSharedPointer<QAbstractSocket> ConnectToHost(const QUrl& url, int timeoutMs = CONNECT_TIMEOUT_MS);
            static void SendRequestHead(QAbstractSocket* socket, const QString& method, const QUrl& url,
                                        qint64 contentLength, const QMap<QString, QString>& extraHeaders,
                                        int timeoutMs);
            static HttpResponseHead ReadResponseHead(QAbstractSocket* socket, int timeoutMs);
            static qint64 CopyStream(QIODevice* source, QIODevice* dest, qint64 length, int timeoutMs,
                                     DataCopiedCallback dataCopiedCallback = nullptr);

            static QString UserAgent();

        private:
            static void writeAll(QIODevice* dest, const char* data, qint64 size, int timeoutMs);
            static QString requestTarget(const QUrl& url);

            int timeoutMs_;
            DataCopiedCallback dataCopiedCallback_;
    };
}

#endif // XENCTL_HTTPCLIENT_H
