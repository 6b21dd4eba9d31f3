#include <QtTest>
#include <stdexcept>
#include "xenctl/xen/failure.h"
#include "xenctl/xen/namespaceresolver.h"
#include "xenctl/xen/session.h"
#include "fakexenserver.h"
#include "test_helpers.h"

using namespace XenCtl;

class SessionTests : public QObject
{
    Q_OBJECT

private slots:
    void normalizeUri_addsHttpScheme()
    {
        QCOMPARE(Session::NormalizeUri("xen1.example.com").toString(), QString("http://xen1.example.com"));
        QCOMPARE(Session::NormalizeUri("xen1:8080").port(), 8080);
        QCOMPARE(Session::NormalizeUri("https://xen1").scheme(), QString("https"));
        QVERIFY_EXCEPTION_THROWN(Session::NormalizeUri(""), std::invalid_argument);
    }

    void open_discoversNamespacesAndLogsIn()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QSharedPointer<Session> session = OpenFakeSession(server);

        QVERIFY(session->IsLoggedIn());
        QCOMPARE(session->GetSessionId(), server->SessionId());
        QCOMPARE(session->GetUsername(), QString("root"));
        QCOMPARE(session->GetHost(), QString("xen1.example.com"));
        QVERIFY(session->GetCatalog().HasNamespace("VM"));

        const QStringList methods = server->CalledMethods();
        QCOMPARE(methods.value(0), QString("system.listMethods"));
        QCOMPARE(methods.value(1), QString("session.login_with_password"));
        QCOMPARE(server->CallsTo("session.login_with_password").first().Arg(0), QString("root"));
    }

    void namespace_callsThroughWithSessionToken()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QVariantMap vms;
        vms.insert("OpaqueRef:vm1", MakeVmRecord("web", "uuid-web"));
        server->SetRecords("VM.get_all_records", vms);

        QSharedPointer<Session> session = OpenFakeSession(server);
        const QVariantMap result = session->Namespace("VM").Call("get_all_records").toMap();

        QCOMPARE(result.keys(), QStringList() << "OpaqueRef:vm1");
        QCOMPARE(result.value("OpaqueRef:vm1").toMap().value("name_label").toString(), QString("web"));

        const RecordedCall call = server->CallsTo("VM.get_all_records").first();
        QCOMPARE(call.params.size(), 1);
        QCOMPARE(call.Arg(0), server->SessionId());
    }

    void namespace_forwardsUnadvertisedMethods()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QSharedPointer<Session> session = OpenFakeSession(server);

        const ApiNamespace vm = session->Namespace("VM");
        QVERIFY(!vm.Advertises("frobnicate"));
        try
        {
            vm.Call("frobnicate");
            QFAIL("RemoteError expected");
        } catch (const RemoteError& error)
        {
            QCOMPARE(error.errorCode(), QString(Failure::MESSAGE_METHOD_UNKNOWN));
        }
        QCOMPARE(server->CountCalls("VM.frobnicate"), 1);
    }

    void namespace_unknownNamespaceIsLookupError()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QSharedPointer<Session> session = OpenFakeSession(server);

        try
        {
            session->Namespace("Nope");
            QFAIL("LookupError expected");
        } catch (const LookupError& error)
        {
            QCOMPARE(error.kind(), QString("namespace"));
            QCOMPARE(error.key(), QString("Nope"));
        }
    }

    void resolve_isIdempotent()
    {
        const MethodCatalog catalog(QStringList() << "VM.clone" << "SR.scan");
        NamespaceResolver resolver;
        QCOMPARE(resolver.Resolve(catalog), 2);
        QCOMPARE(resolver.Resolve(catalog), 0);
        QCOMPARE(resolver.Namespaces(), QStringList() << "SR" << "VM");
    }

    void login_wrongPasswordIsAuthError()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer("xen1", "right"));
        Session session("xen1", server);
        QSignalSpy failed(&session, SIGNAL(loginFailed(QString)));

        try
        {
            session.Login("root", "wrong");
            QFAIL("AuthError expected");
        } catch (const AuthError& error)
        {
            QCOMPARE(error.errorCode(), QString(Failure::SESSION_AUTHENTICATION_FAILED));
            QVERIFY(error.message().contains("root"));
        }
        QVERIFY(!session.IsLoggedIn());
        QCOMPARE(failed.count(), 1);
    }

    void login_nullPasswordAsksPrompt()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        FakeSecretPrompt prompt("secret");

        QSharedPointer<Session> session = Session::Open("xen1", "root", QString(), &prompt, server);

        QVERIFY(session->IsLoggedIn());
        QCOMPARE(prompt.prompts.size(), 1);
        QCOMPARE(prompt.prompts.first(), QString("Enter xen admin password for http://xen1: "));
    }

    void login_givenPasswordNeverPrompts()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        FakeSecretPrompt prompt("ignored");

        Session::Open("xen1", "root", "secret", &prompt, server);
        QVERIFY(prompt.prompts.isEmpty());
    }

    void login_unansweredPromptFails()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        FakeSecretPrompt prompt((QString()));

        QVERIFY_EXCEPTION_THROWN(Session::Open("xen1", "root", QString(), &prompt, server), Failure);
        QCOMPARE(server->CountCalls("session.login_with_password"), 0);
    }

    void call_beforeLoginIsSessionInvalid()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        Session session("xen1", server);

        try
        {
            session.Call("VM.get_all_records");
            QFAIL("Failure expected");
        } catch (const Failure& error)
        {
            QCOMPARE(error.errorCode(), QString(Failure::SESSION_INVALID));
        }
        QVERIFY(server->Calls().isEmpty());
    }
};

QTEST_GUILESS_MAIN(SessionTests)
#include "test_session.moc"
