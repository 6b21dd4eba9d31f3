#include <QtTest>
#include "xenctl/xen/api.h"
#include "xenctl/xen/failure.h"
#include "xenctl/xen/methodcatalog.h"
#include "xenctl/xen/network/httprpctransport.h"
#include "xenctl/xen/xmlrpcclient.h"
#include "fakerpchttpserver.h"
#include "fakexenserver.h"

using namespace XenCtl;

class RpcTests : public QObject
{
    Q_OBJECT

private slots:
    void buildMethodCall_keepsNumericLookingStringsAsStrings()
    {
        const QByteArray body = XmlRpcClient::BuildMethodCall("VM.set_VCPUs_max",
                                                              RpcValueList() << RpcValue::String("OpaqueRef:s")
                                                                             << RpcValue::String("4"));
        QVERIFY(body.contains("<methodName>VM.set_VCPUs_max</methodName>"));
        QVERIFY(body.contains("<string>4</string>"));
        QVERIFY(!body.contains("<int>"));

        QString method;
        const RpcValueList params = XmlRpcClient::ParseMethodCall(body, &method);
        QCOMPARE(method, QString("VM.set_VCPUs_max"));
        QCOMPARE(params.size(), 2);
        QCOMPARE(params.at(1).type(), RpcValue::Type::String);
    }

    void parseMethodResponse_untypedValueIsString()
    {
        const QByteArray body = "<?xml version=\"1.0\"?><methodResponse><params><param>"
                                "<value>OpaqueRef:abc</value>"
                                "</param></params></methodResponse>";
        QCOMPARE(XmlRpcClient::ParseMethodResponse(body).toString(), QString("OpaqueRef:abc"));
    }

    void parseMethodResponse_faultRaisesRemoteError()
    {
        const QByteArray body = XmlRpcClient::BuildFaultResponse(3, "no such method");
        try
        {
            XmlRpcClient::ParseMethodResponse(body, "VM.explode");
            QFAIL("fault was not raised");
        } catch (const RemoteError& error)
        {
            QCOMPARE(error.status(), QString("Fault"));
            QCOMPARE(error.method(), QString("VM.explode"));
        }
    }

    void parseMethodResponse_garbageRaisesTransportError()
    {
        QVERIFY_EXCEPTION_THROWN(XmlRpcClient::ParseMethodResponse("<html>502 Bad Gateway</html>"), TransportError);
    }

    void call_returnsUnwrappedValue()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        server->On("pool.get_all", [](const RpcValueList&)
        {
            return FakeReply::Ok(QVariant(QStringList() << "OpaqueRef:pool"));
        });

        RpcGateway gateway(server, "http://xen1");
        const QVariant value = gateway.Call("pool.get_all", RpcValueList() << RpcValue::String(server->SessionId()));
        QCOMPARE(value.toStringList(), QStringList() << "OpaqueRef:pool");
    }

    void call_nonSuccessStatusRaisesRemoteErrorVerbatim()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        server->On("VM.get_record", [](const RpcValueList& params)
        {
            return FakeReply::Fail(QStringList() << "HANDLE_INVALID" << "VM" << params.at(1).toVariant().toString());
        });
        server->On("VM.get_boot_record", [](const RpcValueList&)
        {
            return FakeReply::Fail(QStringList() << "SOMETHING", "Unusual");
        });

        RpcGateway gateway(server, "http://xen1");
        try
        {
            gateway.Call("VM.get_record", RpcValueList() << RpcValue::String(server->SessionId())
                                                         << RpcValue::String("OpaqueRef:gone"));
            QFAIL("RemoteError expected");
        } catch (const RemoteError& error)
        {
            QCOMPARE(error.status(), QString("Failure"));
            QCOMPARE(error.errorCode(), QString(Failure::HANDLE_INVALID));
            QCOMPARE(error.errorDescription(), QStringList() << "HANDLE_INVALID" << "VM" << "OpaqueRef:gone");
            QVERIFY(error.message().contains("VM.get_record"));
            QVERIFY(error.message().contains("http://xen1"));
        }

        try
        {
            gateway.Call("VM.get_boot_record", RpcValueList() << RpcValue::String(server->SessionId()));
            QFAIL("RemoteError expected");
        } catch (const RemoteError& error)
        {
            QCOMPARE(error.status(), QString("Unusual"));
        }
    }

    void unwrapEnvelope_missingStatusIsTransportError()
    {
        QVariantMap response;
        response.insert("Value", "x");
        QVERIFY_EXCEPTION_THROWN(RpcGateway::UnwrapEnvelope(response, "VM.get_all"), TransportError);
    }

    void callRaw_listMethodsIsNotEnveloped()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        RpcGateway gateway(server, "http://xen1");

        const QStringList methods = gateway.CallRaw("system.listMethods").toStringList();
        QVERIFY(methods.contains("VM.get_all_records"));
        QVERIFY(methods.contains("session.login_with_password"));
    }

    void httpTransport_postsXmlOverHttp()
    {
        FakeRpcHttpServer server;
        server.Start();

        QSharedPointer<RpcTransport> transport(new HttpRpcTransport(QUrl(server.Endpoint()), 5000));
        RpcGateway gateway(transport, server.Endpoint());
        const QVariant value = gateway.Call("pool.get_all", RpcValueList() << RpcValue::String("OpaqueRef:s"));
        QCOMPARE(value.toString(), QString("ok"));

        const QList<RpcHttpRequest> requests = server.Requests();
        QCOMPARE(requests.size(), 1);
        const RpcHttpRequest request = requests.first();
        QCOMPARE(request.method, QString("POST"));
        QCOMPARE(request.target, QString("/"));
        QCOMPARE(request.headers.value("content-type"), QString("text/xml"));
        QCOMPARE(request.headers.value("content-length"), QString::number(request.body.size()));
        QVERIFY(request.headers.value("host").startsWith("127.0.0.1"));

        QString method;
        const RpcValueList params = XmlRpcClient::ParseMethodCall(request.body, &method);
        QCOMPARE(method, QString("pool.get_all"));
        QCOMPARE(params.size(), 1);
        QCOMPARE(params.first().toVariant().toString(), QString("OpaqueRef:s"));
    }

    void httpTransport_reusesKeptAliveConnection()
    {
        FakeRpcHttpServer server;
        server.Start();

        HttpRpcTransport transport(QUrl(server.Endpoint()), 5000);
        const QByteArray call = XmlRpcClient::BuildMethodCall("host.get_all", RpcValueList());
        transport.Post(call);
        transport.Post(call);
        transport.Post(call);

        const QList<RpcHttpRequest> requests = server.Requests();
        QCOMPARE(requests.size(), 3);
        QCOMPARE(server.ConnectionCount(), 1);
        for (const RpcHttpRequest& request : requests)
            QCOMPARE(request.connection, 1);
    }

    void httpTransport_reconnectsAfterConnectionClose()
    {
        FakeRpcHttpServer server;
        server.Start();
        RpcHttpReply closing = RpcHttpReply::Success("first");
        closing.close = true;
        server.Enqueue(closing);
        server.Enqueue(RpcHttpReply::Success("second"));

        HttpRpcTransport transport(QUrl(server.Endpoint()), 5000);
        const QByteArray call = XmlRpcClient::BuildMethodCall("host.get_all", RpcValueList());
        QCOMPARE(RpcGateway::UnwrapEnvelope(XmlRpcClient::ParseMethodResponse(transport.Post(call)), "host.get_all").toString(),
                 QString("first"));
        QCOMPARE(RpcGateway::UnwrapEnvelope(XmlRpcClient::ParseMethodResponse(transport.Post(call)), "host.get_all").toString(),
                 QString("second"));

        QCOMPARE(server.ConnectionCount(), 2);
        QCOMPARE(server.Requests().at(1).connection, 2);
    }

    void httpTransport_readsBodyEndedByConnectionClose()
    {
        FakeRpcHttpServer server;
        server.Start();
        RpcHttpReply unsized = RpcHttpReply::Success("streamed");
        unsized.sendLength = false;
        server.Enqueue(unsized);

        HttpRpcTransport transport(QUrl(server.Endpoint()), 5000);
        const QByteArray call = XmlRpcClient::BuildMethodCall("host.get_all", RpcValueList());
        const QByteArray body = transport.Post(call);
        QCOMPARE(body, RpcHttpReply::Success("streamed").body);

        transport.Post(call);
        QCOMPARE(server.ConnectionCount(), 2);
    }

    void httpTransport_httpErrorDropsConnection()
    {
        FakeRpcHttpServer server;
        server.Start();
        RpcHttpReply broken;
        broken.status = 500;
        broken.body = "<html>Internal Server Error</html>";
        server.Enqueue(broken);

        HttpRpcTransport transport(QUrl(server.Endpoint()), 5000);
        const QByteArray call = XmlRpcClient::BuildMethodCall("host.get_all", RpcValueList());
        try
        {
            transport.Post(call);
            QFAIL("TransportError expected");
        } catch (const TransportError& error)
        {
            QCOMPARE(error.httpStatus(), 500);
        }

        // The next call must not reuse the connection the error came from
        transport.Post(call);
        QCOMPARE(server.Requests().size(), 2);
        QCOMPARE(server.Requests().at(1).connection, 2);
        QCOMPARE(server.ConnectionCount(), 2);
    }

    void httpTransport_unreachableHostRaisesTransportError()
    {
        quint16 port = 0;
        {
            FakeRpcHttpServer server;
            port = server.Start();
        }

        HttpRpcTransport transport(QUrl(QString("http://127.0.0.1:%1").arg(port)), 2000);
        QVERIFY_EXCEPTION_THROWN(transport.Post(XmlRpcClient::BuildMethodCall("host.get_all", RpcValueList())),
                                 TransportError);
    }

    void splitMethodName_data()
    {
        QTest::addColumn<QString>("fullName");
        QTest::addColumn<QString>("ns");
        QTest::addColumn<QString>("method");

        QTest::newRow("plain") << "VM.get_all_records" << "VM" << "get_all_records";
        QTest::newRow("async") << "Async.VM.clone" << "Async.VM" << "clone";
        QTest::newRow("versioned") << "VM.get_record.2" << "VM" << "get_record";
        QTest::newRow("undotted") << "listMethods" << "" << "listMethods";
    }

    void splitMethodName()
    {
        QFETCH(QString, fullName);
        QFETCH(QString, ns);
        QFETCH(QString, method);

        const QPair<QString, QString> split = MethodCatalog::SplitMethodName(fullName);
        QCOMPARE(split.first, ns);
        QCOMPARE(split.second, method);
    }

    void catalog_groupsMethodsByNamespace()
    {
        const MethodCatalog catalog(QStringList() << "VM.clone" << "VM.start" << "host.get_all_records"
                                                  << "system.listMethods");
        QVERIFY(catalog.HasNamespace("VM"));
        QVERIFY(catalog.HasNamespace("host"));
        QVERIFY(!catalog.HasNamespace("SR"));
        QVERIFY(catalog.MethodsIn("VM").contains("clone"));
        QVERIFY(catalog.MethodsIn("VM").contains("start"));
        QVERIFY(catalog.Contains("host.get_all_records"));
    }
};

QTEST_GUILESS_MAIN(RpcTests)
#include "test_rpc.moc"
