/*
 * Copyright (c) 2025, Petr Bena <petr@bena.rocks>
 * All rights reserved.
 */

#ifndef XENCTL_TESTS_FAKERPCHTTPSERVER_H
#define XENCTL_TESTS_FAKERPCHTTPSERVER_H

#include <QAtomicInt>
#include <QByteArray>
#include <QList>
#include <QMap>
#include <QMutex>
#include <QSemaphore>
#include <QString>
#include <QThread>

class QTcpSocket;

struct RpcHttpRequest
{
    int connection = 0; // 1 based, in accept order
    QString method;
    QString target;
    QMap<QString, QString> headers; // lower-cased names
    QByteArray body;
};

struct RpcHttpReply
{
    int status = 200;
    QByteArray body;
    bool close = false;       // answer with "Connection: close" and hang up
    bool sendLength = true;   // without it the body is ended by the hang up

    static RpcHttpReply Success(const QString& value);
};

/**
 * @brief Blocking HTTP/1.1 server in front of an XML-RPC endpoint
 *
 * Connections are kept alive until the client hangs up or a reply asks for
 * close. Replies queued with Enqueue are used in order; once the queue is
 * empty every call succeeds with the value "ok".
 */
class FakeRpcHttpServer : public QThread
{
    public:
        FakeRpcHttpServer();
        ~FakeRpcHttpServer() override;

        quint16 Start();
        void Stop();

        QString Endpoint() const;

        void Enqueue(const RpcHttpReply& reply);

        QList<RpcHttpRequest> Requests() const;
        int ConnectionCount() const;

    protected:
        void run() override;

    private:
        // Returns false once the connection is finished
        bool serveOne(QTcpSocket* socket, int connection);
        bool readLine(QTcpSocket* socket, QByteArray* line);
        RpcHttpReply nextReply();

        mutable QMutex m_lock;
        QList<RpcHttpReply> m_replies;
        QList<RpcHttpRequest> m_requests;
        int m_connections;

        QSemaphore m_listening;
        QAtomicInt m_stop;
        quint16 m_port;
};

#endif // XENCTL_TESTS_FAKERPCHTTPSERVER_H
