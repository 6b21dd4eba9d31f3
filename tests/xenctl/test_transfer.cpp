#include <QtTest>
#include <QFile>
#include <QTemporaryDir>
#include "xenctl/xen/actions/vm/exportvmaction.h"
#include "xenctl/xen/actions/vm/importvmaction.h"
#include "xenctl/xen/actions/vm/transfervmaction.h"
#include "xenctl/xen/failure.h"
#include "xenctl/xen/network/httpclient.h"
#include "xenctl/xen/session.h"
#include "fakebulkserver.h"
#include "fakexenserver.h"
#include "test_helpers.h"

using namespace XenCtl;

namespace
{
    // Large enough to take several rounds of the copy buffer
    QByteArray makePayload(int size = 3 * HttpClient::BUFFER_SIZE + 1234)
    {
        QByteArray payload;
        payload.reserve(size);
        quint32 state = 0x2545F491;
        for (int i = 0; i < size; ++i)
        {
            state = state * 1664525u + 1013904223u;
            payload.append(static_cast<char>(state >> 24));
        }
        return payload;
    }

    PollOptions fastPolling()
    {
        PollOptions options;
        options.intervalMs = 1;
        options.maxAttempts = 5;
        return options;
    }

    void writeFile(const QString& path, const QByteArray& data)
    {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        QCOMPARE(file.write(data), qint64(data.size()));
    }

    QByteArray readFile(const QString& path)
    {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly))
            return QByteArray();
        return file.readAll();
    }

    QVariantMap oneVm()
    {
        QVariantMap vms;
        vms.insert("OpaqueRef:vm", MakeVmRecord("web", "uuid-web"));
        return vms;
    }
}

class TransferTests : public QObject
{
    Q_OBJECT

private slots:
    void init()
    {
        this->bulk = new FakeBulkServer();
        this->bulk->Start();
        QVERIFY(this->dir.isValid());
    }

    void cleanup()
    {
        delete this->bulk;
        this->bulk = nullptr;
    }

    void buildUri_keepsEndpointAndSkipsEmptyParameters()
    {
        const QUrl uri = HttpClient::BuildUri(QUrl("https://xen1:4443/"), "import", QueryParams()
                                              << qMakePair(QString("session_id"), QString("OpaqueRef:s"))
                                              << qMakePair(QString("task_id"), QString("OpaqueRef:t"))
                                              << qMakePair(QString("sr_uuid"), QString()));
        QCOMPARE(uri.scheme(), QString("https"));
        QCOMPARE(uri.host(), QString("xen1"));
        QCOMPARE(uri.port(), 4443);
        QCOMPARE(uri.path(), QString("/import"));
        QCOMPARE(QUrlQuery(uri).queryItemValue("session_id"), QString("OpaqueRef:s"));
        QCOMPARE(QUrlQuery(uri).queryItemValue("task_id"), QString("OpaqueRef:t"));
        QVERIFY(!QUrlQuery(uri).hasQueryItem("sr_uuid"));
    }

    void importThenExport_roundTripIsByteIdentical()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        server->SetTaskResult("<value>OpaqueRef:vm-imported</value>");
        server->SetRecords("VM.get_all_records", oneVm());
        QSharedPointer<Session> session = OpenFakeSession(server, this->bulk->Endpoint());

        const QByteArray payload = makePayload();
        const QString source = this->dir.filePath("in.xva");
        writeFile(source, payload);

        ImportVmAction import(session.data(), source);
        import.setPollOptions(fastPolling());
        QSignalSpy progress(&import, SIGNAL(bytesTransferred(qint64)));
        import.RunSync();

        QCOMPARE(import.result(), QString("OpaqueRef:vm-imported"));
        QVERIFY(progress.count() > 1);
        QCOMPARE(progress.last().first().toLongLong(), qint64(payload.size()));
        QCOMPARE(this->bulk->LastImportBody(), payload);

        const BulkRequest put = this->bulk->Requests().first();
        QCOMPARE(put.method, QString("PUT"));
        QCOMPARE(put.query.queryItemValue("session_id"), server->SessionId());
        QCOMPARE(put.query.queryItemValue("task_id"), server->CreatedTasks().first());
        QVERIFY(!put.query.hasQueryItem("sr_uuid"));
        QCOMPARE(put.headers.value("content-length"), QString::number(payload.size()));
        QCOMPARE(server->CallsTo("task.create").first().Arg(1), QString("import_") + source);

        this->bulk->SetExportBody(this->bulk->LastImportBody());
        const QString target = this->dir.filePath("out.xva");
        ExportVmAction exportAction(session.data(), "web", target);
        exportAction.setPollOptions(fastPolling());
        exportAction.RunSync();

        QCOMPARE(exportAction.result(), target);
        QCOMPARE(readFile(target), payload);
        QVERIFY(!QFile::exists(target + ".tmp"));

        const BulkRequest get = this->bulk->Requests().last();
        QCOMPARE(get.method, QString("GET"));
        QCOMPARE(get.path, QString("/export"));
        QCOMPARE(get.query.queryItemValue("ref"), QString("OpaqueRef:vm"));
        QCOMPARE(get.query.queryItemValue("task_id"), server->CreatedTasks().last());
        QCOMPARE(server->DestroyedTasks(), server->CreatedTasks());
    }

    void import_passesStorageRepositoryUuid()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QVariantMap sr;
        sr.insert("name_label", "Local storage");
        sr.insert("uuid", "uuid-sr-1");
        QVariantMap srs;
        srs.insert("OpaqueRef:sr1", sr);
        server->SetRecords("SR.get_all_records", srs);
        QSharedPointer<Session> session = OpenFakeSession(server, this->bulk->Endpoint());

        const QString source = this->dir.filePath("small.xva");
        writeFile(source, "XVA");

        ImportVmAction import(session.data(), source, "Local storage");
        import.setPollOptions(fastPolling());
        import.RunSync();

        QCOMPARE(this->bulk->Requests().first().query.queryItemValue("sr_uuid"), QString("uuid-sr-1"));
    }

    void import_httpErrorStillDestroysTask()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        server->SetTaskStatuses(QStringList() << "failure");
        QSharedPointer<Session> session = OpenFakeSession(server, this->bulk->Endpoint());
        this->bulk->SetImportStatus(500);

        const QString source = this->dir.filePath("in.xva");
        writeFile(source, makePayload(1000));

        ImportVmAction import(session.data(), source);
        import.setPollOptions(fastPolling());
        try
        {
            import.RunSync();
            QFAIL("TransportError expected");
        } catch (const TransportError& error)
        {
            QCOMPARE(error.httpStatus(), 500);
            QCOMPARE(error.message(), QString("import returned HTTP status code: 500"));
        }
        QCOMPARE(import.state(), Operation::Failed);
        QCOMPARE(server->CreatedTasks().size(), 1);
        QCOMPARE(server->DestroyedTasks(), server->CreatedTasks());
    }

    void import_unreadableFileCreatesNoTask()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QSharedPointer<Session> session = OpenFakeSession(server, this->bulk->Endpoint());

        ImportVmAction import(session.data(), this->dir.filePath("missing.xva"));
        QVERIFY_EXCEPTION_THROWN(import.RunSync(), Failure);
        QCOMPARE(server->CountCalls("task.create"), 0);
        QVERIFY(this->bulk->Requests().isEmpty());
    }

    void export_httpErrorLeavesNoFile()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        server->SetRecords("VM.get_all_records", oneVm());
        QSharedPointer<Session> session = OpenFakeSession(server, this->bulk->Endpoint());
        this->bulk->SetExportStatus(403);

        const QString target = this->dir.filePath("denied.xva");
        ExportVmAction exportAction(session.data(), "web", target);
        exportAction.setPollOptions(fastPolling());
        try
        {
            exportAction.RunSync();
            QFAIL("TransportError expected");
        } catch (const TransportError& error)
        {
            QCOMPARE(error.httpStatus(), 403);
        }
        QVERIFY(!QFile::exists(target));
        QVERIFY(!QFile::exists(target + ".tmp"));
        QCOMPARE(server->DestroyedTasks().size(), 1);
    }

    void transfer_relaysExportIntoImport()
    {
        QSharedPointer<FakeXenServer> source(new FakeXenServer("src"));
        QSharedPointer<FakeXenServer> destination(new FakeXenServer("dst"));
        source->SetRecords("VM.get_all_records", oneVm());
        QSharedPointer<Session> sourceSession = OpenFakeSession(source, this->bulk->Endpoint());
        QSharedPointer<Session> destinationSession = OpenFakeSession(destination, this->bulk->Endpoint());

        const QByteArray payload = makePayload();
        this->bulk->SetExportBody(payload);

        TransferVmAction transfer(sourceSession.data(), "web", destinationSession.data());
        transfer.setPollOptions(fastPolling());
        transfer.RunSync();

        QCOMPARE(this->bulk->LastImportBody(), payload);

        const QList<BulkRequest> requests = this->bulk->Requests();
        QCOMPARE(requests.size(), 2);
        QCOMPARE(requests.at(0).path, QString("/export"));
        QCOMPARE(requests.at(0).query.queryItemValue("task_id"), source->CreatedTasks().first());
        QCOMPARE(requests.at(0).query.queryItemValue("session_id"), source->SessionId());
        QCOMPARE(requests.at(1).path, QString("/import"));
        QCOMPARE(requests.at(1).query.queryItemValue("task_id"), destination->CreatedTasks().first());
        QCOMPARE(requests.at(1).query.queryItemValue("session_id"), destination->SessionId());
        QCOMPARE(requests.at(1).headers.value("content-length"), QString::number(payload.size()));

        QCOMPARE(source->DestroyedTasks(), source->CreatedTasks());
        QCOMPARE(destination->DestroyedTasks(), destination->CreatedTasks());
    }

    void export_bodyEndedByConnectionClose()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        server->SetRecords("VM.get_all_records", oneVm());
        QSharedPointer<Session> session = OpenFakeSession(server, this->bulk->Endpoint());

        const QByteArray payload = makePayload();
        this->bulk->SetExportBody(payload);
        this->bulk->SetExportLengthKnown(false);

        const QString target = this->dir.filePath("streamed.xva");
        ExportVmAction exportAction(session.data(), "web", target);
        exportAction.setPollOptions(fastPolling());
        QSignalSpy progress(&exportAction, SIGNAL(bytesTransferred(qint64)));
        exportAction.RunSync();

        QCOMPARE(readFile(target), payload);
        QVERIFY(!QFile::exists(target + ".tmp"));
        QCOMPARE(progress.last().first().toLongLong(), qint64(payload.size()));
        QCOMPARE(server->DestroyedTasks(), server->CreatedTasks());
    }

    void transfer_unknownLengthIsRelayedWithoutContentLength()
    {
        QSharedPointer<FakeXenServer> source(new FakeXenServer("src"));
        QSharedPointer<FakeXenServer> destination(new FakeXenServer("dst"));
        source->SetRecords("VM.get_all_records", oneVm());
        QSharedPointer<Session> sourceSession = OpenFakeSession(source, this->bulk->Endpoint());
        QSharedPointer<Session> destinationSession = OpenFakeSession(destination, this->bulk->Endpoint());

        const QByteArray payload = makePayload();
        this->bulk->SetExportBody(payload);
        this->bulk->SetExportLengthKnown(false);

        TransferVmAction transfer(sourceSession.data(), "web", destinationSession.data());
        transfer.setPollOptions(fastPolling());
        transfer.RunSync();

        QCOMPARE(this->bulk->LastImportBody(), payload);
        const QList<BulkRequest> requests = this->bulk->Requests();
        QCOMPARE(requests.size(), 2);
        QCOMPARE(requests.at(1).path, QString("/import"));
        QVERIFY(!requests.at(1).headers.contains("content-length"));
        QCOMPARE(source->DestroyedTasks(), source->CreatedTasks());
        QCOMPARE(destination->DestroyedTasks(), destination->CreatedTasks());
    }

    void transfer_exportFailureDestroysBothTasks()
    {
        QSharedPointer<FakeXenServer> source(new FakeXenServer("src"));
        QSharedPointer<FakeXenServer> destination(new FakeXenServer("dst"));
        source->SetRecords("VM.get_all_records", oneVm());
        source->SetTaskStatuses(QStringList() << "failure");
        source->SetTaskErrorInfo(QStringList() << "VM_BAD_POWER_STATE");
        destination->SetTaskStatuses(QStringList() << "cancelled");
        QSharedPointer<Session> sourceSession = OpenFakeSession(source, this->bulk->Endpoint());
        QSharedPointer<Session> destinationSession = OpenFakeSession(destination, this->bulk->Endpoint());
        this->bulk->SetExportStatus(500);

        TransferVmAction transfer(sourceSession.data(), "web", destinationSession.data());
        transfer.setPollOptions(fastPolling());
        try
        {
            transfer.RunSync();
            QFAIL("CompositeFailure expected");
        } catch (const CompositeFailure& failure)
        {
            QVERIFY(failure.messages().contains("export returned HTTP status code: 500"));
            QVERIFY(failure.message().startsWith("Transfer failed:"));
            QCOMPARE(failure.messages().size(), 3);
        }

        QCOMPARE(source->CreatedTasks().size(), 1);
        QCOMPARE(destination->CreatedTasks().size(), 1);
        QCOMPARE(source->DestroyedTasks(), source->CreatedTasks());
        QCOMPARE(destination->DestroyedTasks(), destination->CreatedTasks());
        QCOMPARE(this->bulk->Requests().size(), 1);
    }

private:
    FakeBulkServer* bulk = nullptr;
    QTemporaryDir dir;
};

QTEST_GUILESS_MAIN(TransferTests)
#include "test_transfer.moc"
