/*
 * Copyright (c) 2025, Petr Bena <petr@bena.rocks>
 * All rights reserved.
 */

#ifndef XENCTL_TESTS_FAKEBULKSERVER_H
#define XENCTL_TESTS_FAKEBULKSERVER_H

#include <QAtomicInt>
#include <QByteArray>
#include <QList>
#include <QMap>
#include <QMutex>
#include <QSemaphore>
#include <QString>
#include <QThread>
#include <QUrlQuery>

class QTcpSocket;

struct BulkRequest
{
    QString method;
    QString path;
    QUrlQuery query;
    QMap<QString, QString> headers; // lower-cased names
    QByteArray body;
};

/**
 * @brief Blocking HTTP server for the /import and /export handlers
 *
 * Runs on its own thread so that the synchronous client under test can
 * talk to it. A PUT on /import stores the body; a GET on /export serves
 * the configured body. Both answer with the configured status code.
 */
class FakeBulkServer : public QThread
{
    public:
        FakeBulkServer();
        ~FakeBulkServer() override;

        // Starts listening on 127.0.0.1; returns the port
        quint16 Start();
        void Stop();

        QString Endpoint() const;

        void SetImportStatus(int status);
        void SetExportStatus(int status);
        void SetExportBody(const QByteArray& body);
        // When false the export body is ended by closing the connection
        void SetExportLengthKnown(bool known);

        QList<BulkRequest> Requests() const;
        QByteArray LastImportBody() const;

    protected:
        void run() override;

    private:
        void serve(QTcpSocket* socket);
        bool readLine(QTcpSocket* socket, QByteArray* line);

        mutable QMutex m_lock;
        int m_importStatus;
        int m_exportStatus;
        QByteArray m_exportBody;
        bool m_exportLengthKnown;
        QList<BulkRequest> m_requests;

        QSemaphore m_listening;
        QAtomicInt m_stop;
        quint16 m_port;
};

#endif // XENCTL_TESTS_FAKEBULKSERVER_H
