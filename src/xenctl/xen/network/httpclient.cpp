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

#include "httpclient.h"
#include "../failure.h"
#include "../../xenctl_global.h"
#include <QtCore/QDebug>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QUrlQuery>
#include <QtNetwork/QSslConfiguration>
#include <QtNetwork/QSslSocket>
#include <QtNetwork/QTcpSocket>

namespace XenCtl
{
    qint64 HttpResponseHead::contentLength() const
    {
        bool ok = false;
        const qint64 length = this->headers.value("content-length").trimmed().toLongLong(&ok);
        return ok ? length : -1;
    }

    HttpClient::HttpClient(int timeoutMs) : timeoutMs_(timeoutMs)
    {
    }

    QString HttpClient::UserAgent()
    {
        return QString("xenctl/%1").arg(XENCTL_VERSION);
    }

    QUrl HttpClient::BuildUri(const QUrl& base, const QString& path, const QueryParams& queryParams)
    {
        QUrl url;
        url.setScheme(base.scheme().isEmpty() ? QString("http") : base.scheme());
        url.setHost(base.host());
        if (base.port() > 0)
            url.setPort(base.port());
        url.setPath(path.startsWith('/') ? path : "/" + path);

        QUrlQuery query;
        for (const auto& item : queryParams)
        {
            if (!item.second.isEmpty())
                query.addQueryItem(item.first, item.second);
        }
        url.setQuery(query);

        return url;
    }

    QString HttpClient::requestTarget(const QUrl& url)
    {
        QString target = url.path(QUrl::FullyEncoded);
        if (target.isEmpty())
            target = "/";
        if (url.hasQuery())
            target += "?" + url.query(QUrl::FullyEncoded);
        return target;
    }

    QSharedPointer<QAbstractSocket> HttpClient::ConnectToHost(const QUrl& url, int timeoutMs)
    {
        const bool secure = url.scheme() == "https";
        const int port = url.port(secure ? 443 : 80);
        QSharedPointer<QAbstractSocket> socket;

        if (secure)
        {
            QSslSocket* sslSocket = new QSslSocket();
            socket = QSharedPointer<QAbstractSocket>(sslSocket);

            // XenServer ships self-signed certificates
            QSslConfiguration sslConfig = sslSocket->sslConfiguration();
            sslConfig.setPeerVerifyMode(QSslSocket::VerifyNone);
            sslSocket->setSslConfiguration(sslConfig);

            sslSocket->connectToHostEncrypted(url.host(), port);
            if (!sslSocket->waitForEncrypted(timeoutMs))
            {
                throw TransportError(QString("Failed to connect to %1:%2: %3")
                                         .arg(url.host()).arg(port).arg(sslSocket->errorString()));
            }
        } else
        {
            socket = QSharedPointer<QAbstractSocket>(new QTcpSocket());
            socket->connectToHost(url.host(), port);
            if (!socket->waitForConnected(timeoutMs))
            {
                throw TransportError(QString("Failed to connect to %1:%2: %3")
                                         .arg(url.host()).arg(port).arg(socket->errorString()));
            }
        }

        qDebug() << "HttpClient: connected to" << url.host() << port;
        return socket;
    }

    void HttpClient::SendRequestHead(QAbstractSocket* socket, const QString& method, const QUrl& url,
                                     qint64 contentLength, const QMap<QString, QString>& extraHeaders,
                                     int timeoutMs)
    {
        QString head = QString("%1 %2 HTTP/1.1\r\n").arg(method, requestTarget(url));
        if (url.port() > 0)
            head += QString("Host: %1:%2\r\n").arg(url.host()).arg(url.port());
        else
            head += QString("Host: %1\r\n").arg(url.host());
        head += QString("User-Agent: %1\r\n").arg(UserAgent());
        if (contentLength >= 0)
            head += QString("Content-Length: %1\r\n").arg(contentLength);
        for (auto it = extraHeaders.constBegin(); it != extraHeaders.constEnd(); ++it)
            head += QString("%1: %2\r\n").arg(it.key(), it.value());
        head += "\r\n";

        const QByteArray data = head.toUtf8();
        writeAll(socket, data.constData(), data.size(), timeoutMs);
        if (socket->bytesToWrite() > 0 && !socket->waitForBytesWritten(timeoutMs))
            throw TransportError(QString("Failed to send %1 request: %2").arg(method, socket->errorString()));
    }

    HttpResponseHead HttpClient::ReadResponseHead(QAbstractSocket* socket, int timeoutMs)
    {
        auto readLine = [socket, timeoutMs]() -> QString
        {
            while (!socket->canReadLine())
            {
                if (!socket->waitForReadyRead(timeoutMs) && !socket->canReadLine())
                {
                    throw TransportError(QString("No HTTP response from server: %1").arg(socket->errorString()));
                }
            }
            return QString::fromLatin1(socket->readLine()).trimmed();
        };

        HttpResponseHead head;
        head.statusLine = readLine();

        // HTTP/1.1 200 OK
        const QStringList parts = head.statusLine.split(' ', Qt::SkipEmptyParts);
        bool ok = false;
        if (parts.size() >= 2 && parts.at(0).startsWith("HTTP/"))
            head.statusCode = parts.at(1).toInt(&ok);
        if (!ok)
            throw TransportError(QString("Malformed HTTP status line: %1").arg(head.statusLine));

        for (;;)
        {
            const QString line = readLine();
            if (line.isEmpty())
                break;
            const int colon = line.indexOf(':');
            if (colon > 0)
                head.headers.insert(line.left(colon).trimmed().toLower(), line.mid(colon + 1).trimmed());
        }

        if (head.headers.value("transfer-encoding").compare("chunked", Qt::CaseInsensitive) == 0)
            throw TransportError("Chunked HTTP responses are not supported", head.statusCode);

        return head;
    }

    void HttpClient::writeAll(QIODevice* dest, const char* data, qint64 size, int timeoutMs)
    {
        const qint64 written = dest->write(data, size);
        if (written != size)
            throw TransportError(QString("Failed to write data: %1").arg(dest->errorString()));

        // Keep the socket write buffer bounded
        QAbstractSocket* socket = qobject_cast<QAbstractSocket*>(dest);
        if (!socket)
            return;
        while (socket->bytesToWrite() > 4 * BUFFER_SIZE)
        {
            if (!socket->waitForBytesWritten(timeoutMs))
                throw TransportError(QString("Failed to send data: %1").arg(socket->errorString()));
        }
    }

    qint64 HttpClient::CopyStream(QIODevice* source, QIODevice* dest, qint64 length, int timeoutMs,
                                  DataCopiedCallback dataCopiedCallback)
    {
        QByteArray buffer(BUFFER_SIZE, Qt::Uninitialized);
        QAbstractSocket* sourceSocket = qobject_cast<QAbstractSocket*>(source);
        qint64 total = 0;

        while (length < 0 || total < length)
        {
            qint64 wanted = BUFFER_SIZE;
            if (length >= 0)
                wanted = qMin(wanted, length - total);

            const qint64 read = source->read(buffer.data(), wanted);
            if (read < 0)
                throw TransportError(QString("Failed to read data: %1").arg(source->errorString()));

            if (read == 0)
            {
                // End of file
                if (!sourceSocket)
                    break;
                if (sourceSocket->bytesAvailable() > 0)
                    continue;
                // Peer closed the connection, body delimited by close
                if (sourceSocket->state() != QAbstractSocket::ConnectedState)
                    break;
                if (!sourceSocket->waitForReadyRead(timeoutMs))
                {
                    if (sourceSocket->bytesAvailable() > 0)
                        continue;
                    if (sourceSocket->state() != QAbstractSocket::ConnectedState)
                        break;
                    throw TransportError(QString("Timed out reading data: %1").arg(sourceSocket->errorString()));
                }
                continue;
            }

            writeAll(dest, buffer.constData(), read, timeoutMs);
            total += read;

            if (dataCopiedCallback)
                dataCopiedCallback(total);
        }

        if (length >= 0 && total < length)
            throw TransportError(QString("Connection closed after %1 of %2 bytes").arg(total).arg(length));

        QAbstractSocket* destSocket = qobject_cast<QAbstractSocket*>(dest);
        if (destSocket)
        {
            while (destSocket->bytesToWrite() > 0)
            {
                if (!destSocket->waitForBytesWritten(timeoutMs))
                    throw TransportError(QString("Failed to send data: %1").arg(destSocket->errorString()));
            }
        }

        return total;
    }

    qint64 HttpClient::PutFile(const QUrl& uri, const QString& localFilePath)
    {
        QFile file(localFilePath);
        if (!file.open(QIODevice::ReadOnly))
            throw Failure(QString("Could not open %1 for reading: %2").arg(localFilePath, file.errorString()));

        qDebug() << "HttpClient: PUT" << uri.path() << "from" << localFilePath << file.size() << "bytes";

        QSharedPointer<QAbstractSocket> socket = ConnectToHost(uri);
        QMap<QString, QString> headers;
        headers.insert("Connection", "close");
        SendRequestHead(socket.data(), "PUT", uri, file.size(), headers, this->timeoutMs_);

        const qint64 sent = CopyStream(&file, socket.data(), file.size(), this->timeoutMs_, this->dataCopiedCallback_);
        file.close();

        const HttpResponseHead head = ReadResponseHead(socket.data(), this->timeoutMs_);
        socket->disconnectFromHost();
        if (head.statusCode != 200)
        {
            throw TransportError(QString("import returned HTTP status code: %1").arg(head.statusCode),
                                 head.statusCode);
        }

        return sent;
    }

    qint64 HttpClient::GetFile(const QUrl& uri, const QString& localFilePath)
    {
        qDebug() << "HttpClient: GET" << uri.path() << "to" << localFilePath;

        QSharedPointer<QAbstractSocket> socket = ConnectToHost(uri);
        QMap<QString, QString> headers;
        headers.insert("Connection", "close");
        SendRequestHead(socket.data(), "GET", uri, -1, headers, this->timeoutMs_);

        const HttpResponseHead head = ReadResponseHead(socket.data(), this->timeoutMs_);
        if (head.statusCode != 200)
        {
            socket->abort();
            throw TransportError(QString("export returned HTTP status code: %1").arg(head.statusCode),
                                 head.statusCode);
        }

        const QString tmpFile = localFilePath + ".tmp";
        QFile file(tmpFile);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        {
            socket->abort();
            throw Failure(QString("Could not open %1 for writing: %2").arg(tmpFile, file.errorString()));
        }

        qint64 received = 0;
        try
        {
            received = CopyStream(socket.data(), &file, head.contentLength(), this->timeoutMs_,
                                  this->dataCopiedCallback_);
        } catch (const Failure&)
        {
            file.close();
            QFile::remove(tmpFile);
            throw;
        }
        file.close();
        socket->abort();

        if (QFile::exists(localFilePath))
            QFile::remove(localFilePath);
        if (!QFile::rename(tmpFile, localFilePath))
            throw Failure(QString("Could not rename %1 to %2").arg(tmpFile, localFilePath));

        return received;
    }

    qint64 HttpClient::Relay(const QUrl& exportUri, const QUrl& importUri)
    {
        qDebug() << "HttpClient: relaying" << exportUri.host() << "->" << importUri.host();

        QMap<QString, QString> headers;
        headers.insert("Connection", "close");

        QSharedPointer<QAbstractSocket> exportSocket = ConnectToHost(exportUri);
        SendRequestHead(exportSocket.data(), "GET", exportUri, -1, headers, this->timeoutMs_);
        const HttpResponseHead exportHead = ReadResponseHead(exportSocket.data(), this->timeoutMs_);
        if (exportHead.statusCode != 200)
        {
            exportSocket->abort();
            throw TransportError(QString("export returned HTTP status code: %1").arg(exportHead.statusCode),
                                 exportHead.statusCode);
        }

        // The import side learns the length from the export side when it is known,
        // otherwise the XVA stream is self delimiting
        QSharedPointer<QAbstractSocket> importSocket = ConnectToHost(importUri);
        SendRequestHead(importSocket.data(), "PUT", importUri, exportHead.contentLength(), headers, this->timeoutMs_);

        const qint64 relayed = CopyStream(exportSocket.data(), importSocket.data(), exportHead.contentLength(),
                                          this->timeoutMs_, this->dataCopiedCallback_);
        exportSocket->abort();

        const HttpResponseHead importHead = ReadResponseHead(importSocket.data(), this->timeoutMs_);
        importSocket->disconnectFromHost();
        if (importHead.statusCode != 200)
        {
            throw TransportError(QString("import returned HTTP status code: %1").arg(importHead.statusCode),
                                 importHead.statusCode);
        }

        qDebug() << "HttpClient: relayed" << relayed << "bytes";
        return relayed;
    }
}
