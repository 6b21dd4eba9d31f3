#include <QtTest>
#include <QTemporaryFile>
#include <stdexcept>
#include "xenctl/utils/misc.h"
#include "xenctl/utils/remoteshell.h"
#include "xenctl/xen/actions/vm/createvmaction.h"
#include "xenctl/xen/actions/vm/destroyvmaction.h"
#include "xenctl/xen/actions/vm/runscriptaction.h"
#include "xenctl/xen/actions/vm/settemplateaction.h"
#include "xenctl/xen/failure.h"
#include "xenctl/xen/inventory.h"
#include "xenctl/xen/lookup.h"
#include "xenctl/xen/session.h"
#include "xenctl/xen/vmhelpers.h"
#include "fakexenserver.h"
#include "test_helpers.h"

using namespace XenCtl;

namespace
{
    FakeReply methodUnknown(const RpcValueList&)
    {
        return FakeReply::Fail(QStringList() << "MESSAGE_METHOD_UNKNOWN");
    }

    void serveGuestIp(const QSharedPointer<FakeXenServer>& server, const QString& ip)
    {
        server->On("VM.get_guest_metrics", [](const RpcValueList&)
        {
            return FakeReply::Ok(RpcValue::String("OpaqueRef:metrics"));
        });
        server->On("VM_guest_metrics.get_networks", [ip](const RpcValueList&)
        {
            QVariantMap networks;
            networks.insert("0/ip", ip);
            return FakeReply::Ok(QVariant(networks));
        });
    }
}

class WorkflowTests : public QObject
{
    Q_OBJECT

private slots:
    void naturalCompare_ordersEmbeddedNumbers()
    {
        QVERIFY(Misc::NaturalCompare("vm2", "vm10") < 0);
        QVERIFY(Misc::NaturalCompare("vm10", "vm2") > 0);
        QVERIFY(Misc::NaturalCompare("VM007", "vm7") == 0);
        QVERIFY(Misc::NaturalCompare("alpha", "beta") < 0);
    }

    void parseByteCount_data()
    {
        QTest::addColumn<QString>("text");
        QTest::addColumn<qint64>("bytes");

        QTest::newRow("plain") << "4096" << qint64(4096);
        QTest::newRow("kilo") << "64k" << qint64(64) * 1024;
        QTest::newRow("mega") << "512M" << qint64(512) * 1024 * 1024;
        QTest::newRow("giga") << "2G" << qint64(2) * 1024 * 1024 * 1024;
        QTest::newRow("fraction") << "1.5g" << qint64(3) * 512 * 1024 * 1024;
        QTest::newRow("iec suffix") << "8GiB" << qint64(8) * 1024 * 1024 * 1024;
    }

    void parseByteCount()
    {
        QFETCH(QString, text);
        QFETCH(qint64, bytes);
        QCOMPARE(Misc::ParseByteCount(text), bytes);
    }

    void parseByteCount_rejectsGarbage()
    {
        QVERIFY_EXCEPTION_THROWN(Misc::ParseByteCount("lots"), std::invalid_argument);
        QVERIFY_EXCEPTION_THROWN(Misc::ParseByteCount("2X"), std::invalid_argument);
        QVERIFY_EXCEPTION_THROWN(Misc::ParseByteCount(""), std::invalid_argument);
    }

    void formatBytesIec()
    {
        QCOMPARE(Misc::FormatBytesIec(512), QString("512 B"));
        QCOMPARE(Misc::FormatBytesIec(qint64(3) * 512 * 1024 * 1024), QString("1.50 GiB"));
    }

    void lookup_matchesNameUuidOrRef()
    {
        QVariantMap records;
        records.insert("OpaqueRef:a", MakeVmRecord("db", "uuid-a"));
        records.insert("OpaqueRef:b", MakeVmRecord("web", "uuid-b"));

        QCOMPARE(RecordLookup::FindUnique(records, "web", "VM"), QString("OpaqueRef:b"));
        QCOMPARE(RecordLookup::FindUnique(records, "uuid-a", "VM"), QString("OpaqueRef:a"));
        QCOMPARE(RecordLookup::FindUnique(records, "OpaqueRef:b", "VM"), QString("OpaqueRef:b"));
    }

    void lookup_isDeterministicAndReportsCandidates()
    {
        QVariantMap records;
        records.insert("OpaqueRef:z", MakeVmRecord("debian", "uuid-2"));
        records.insert("OpaqueRef:a", MakeVmRecord("debian", "uuid-1"));
        records.insert("OpaqueRef:m", MakeVmRecord("centos", "uuid-3"));

        const QStringList first = RecordLookup::FindMatches(records, "debian");
        QCOMPARE(first, QStringList() << "OpaqueRef:a" << "OpaqueRef:z");
        QCOMPARE(RecordLookup::FindMatches(records, "debian"), first);

        try
        {
            RecordLookup::FindUnique(records, "debian", "template");
            QFAIL("LookupError expected");
        } catch (const LookupError& error)
        {
            QCOMPARE(error.candidates(), QStringList() << "\"debian\" (uuid-1)" << "\"debian\" (uuid-2)");
            QVERIFY(error.message().startsWith("Multiple templates found matching \"debian\""));
        }

        try
        {
            RecordLookup::FindUnique(records, "ubuntu", "VM");
            QFAIL("LookupError expected");
        } catch (const LookupError& error)
        {
            QVERIFY(error.candidates().isEmpty());
            QCOMPARE(error.message(), QString("No VM named \"ubuntu\""));
        }
    }

    void createVm_duplicateTemplatesNeverClone()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QVariantMap vms;
        vms.insert("OpaqueRef:t1", MakeVmRecord("debian", "uuid-t1", "Halted", true, QStringList() << "OpaqueRef:vbd1"));
        vms.insert("OpaqueRef:t2", MakeVmRecord("debian", "uuid-t2", "Halted", true, QStringList() << "OpaqueRef:vbd2"));
        server->SetRecords("VM.get_all_records", vms);
        QSharedPointer<Session> session = OpenFakeSession(server);

        CreateVmAction action(session.data(), "new-vm", "debian", 0, QString(), 0);
        QVERIFY_EXCEPTION_THROWN(action.RunSync(), LookupError);
        QCOMPARE(action.state(), Operation::Failed);
        QCOMPARE(server->CountCalls("VM.clone"), 0);
    }

    void createVm_ignoresTemplatesWithoutDisks()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QVariantMap vms;
        vms.insert("OpaqueRef:t1", MakeVmRecord("debian", "uuid-t1", "Halted", true));
        vms.insert("OpaqueRef:t2", MakeVmRecord("debian", "uuid-t2", "Halted", true, QStringList() << "OpaqueRef:vbd2"));
        server->SetRecords("VM.get_all_records", vms);
        server->On("VM.clone", [](const RpcValueList&) { return FakeReply::Ok(RpcValue::String("OpaqueRef:new")); });
        QSharedPointer<Session> session = OpenFakeSession(server);

        CreateVmAction action(session.data(), "new-vm", "debian", 2, QString(), 0);
        action.RunSync();

        QCOMPARE(action.vmRef(), QString("OpaqueRef:new"));
        const RecordedCall clone = server->CallsTo("VM.clone").first();
        QCOMPARE(clone.Arg(1), QString("OpaqueRef:t2"));
        QCOMPARE(clone.Arg(2), QString("new-vm"));

        QCOMPARE(server->CallsTo("VM.set_VCPUs_max").first().Arg(2), QString("2"));
        QCOMPARE(server->CallsTo("VM.set_VCPUs_at_startup").first().Arg(2), QString("2"));

        const QStringList methods = server->CalledMethods();
        QVERIFY(methods.indexOf("VM.provision") < methods.indexOf("VM.start"));
        const RecordedCall start = server->CallsTo("VM.start").first();
        QCOMPARE(start.params.at(2), RpcValue::Boolean(false));
        QCOMPARE(start.params.at(3), RpcValue::Boolean(true));
        QCOMPARE(server->CountCalls("VM.get_guest_metrics"), 0);
    }

    void createVm_memoryFallsBackToSingleSetters()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QVariantMap vms;
        vms.insert("OpaqueRef:t", MakeVmRecord("tmpl", "uuid-t", "Halted", true, QStringList() << "OpaqueRef:vbd"));
        server->SetRecords("VM.get_all_records", vms);
        server->On("VM.clone", [](const RpcValueList&) { return FakeReply::Ok(RpcValue::String("OpaqueRef:new")); });
        server->On("VM.set_memory_limits", methodUnknown);
        serveGuestIp(server, "10.0.0.7");
        QSharedPointer<Session> session = OpenFakeSession(server);

        CreateVmAction action(session.data(), "new-vm", "tmpl", 0, "1G", 1);
        action.RunSync();

        const QString oneGig = QString::number(qint64(1024) * 1024 * 1024);
        QCOMPARE(server->CountCalls("VM.set_memory_limits"), 1);
        QCOMPARE(server->CallsTo("VM.set_memory_limits").first().Arg(2), oneGig);
        QCOMPARE(server->CallsTo("VM.set_memory_limits").first().params.at(2).type(), RpcValue::Type::String);
        QCOMPARE(server->CallsTo("VM.set_memory_dynamic_min").first().Arg(2), oneGig);
        QCOMPARE(server->CallsTo("VM.set_memory_dynamic_max").first().Arg(2), oneGig);
        QCOMPARE(server->CallsTo("VM.set_memory_static_min").first().Arg(2), oneGig);
        QCOMPARE(server->CallsTo("VM.set_memory_static_max").first().Arg(2), oneGig);
        QCOMPARE(server->CountCalls("VM.start"), 1);
        QCOMPARE(action.ipAddress(), QString("10.0.0.7"));
        QCOMPARE(action.state(), Operation::Completed);
    }

    void createVm_memoryFailsWhenEveryVariantFails()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QVariantMap vms;
        vms.insert("OpaqueRef:t", MakeVmRecord("tmpl", "uuid-t", "Halted", true, QStringList() << "OpaqueRef:vbd"));
        server->SetRecords("VM.get_all_records", vms);
        server->On("VM.set_memory_limits", methodUnknown);
        server->On("VM.set_memory_dynamic_min", methodUnknown);
        QSharedPointer<Session> session = OpenFakeSession(server);

        CreateVmAction action(session.data(), "new-vm", "tmpl", 0, "512M", 0);
        try
        {
            action.RunSync();
            QFAIL("CompositeFailure expected");
        } catch (const CompositeFailure& failure)
        {
            QCOMPARE(failure.messages().size(), 2);
            QVERIFY(failure.message().startsWith("Could not set memory for new-vm:"));
        }
        QCOMPARE(server->CountCalls("VM.start"), 0);
    }

    void createVm_rejectsBadArguments()
    {
        QVERIFY_EXCEPTION_THROWN(CreateVmAction(nullptr, "vm", QString()), std::invalid_argument);
        QVERIFY_EXCEPTION_THROWN(CreateVmAction(nullptr, QString(), "tmpl"), std::invalid_argument);
        QVERIFY_EXCEPTION_THROWN(CreateVmAction(nullptr, "vm", "tmpl", 0, "much"), std::invalid_argument);
    }

    void destroyVm_shutsDownAndKeepsCdImages()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QVariantMap vms;
        vms.insert("OpaqueRef:vm", MakeVmRecord("web", "uuid-vm", "Running", false,
                                                QStringList() << "OpaqueRef:vbd-disk" << "OpaqueRef:vbd-cd"
                                                              << "OpaqueRef:vbd-empty"));
        server->SetRecords("VM.get_all_records", vms);
        server->On("VBD.get_record", [](const RpcValueList& params)
        {
            const QString vbd = params.at(1).toVariant().toString();
            QVariantMap record;
            if (vbd == "OpaqueRef:vbd-disk")
            {
                record.insert("type", "Disk");
                record.insert("VDI", "OpaqueRef:vdi-disk");
            } else if (vbd == "OpaqueRef:vbd-cd")
            {
                record.insert("type", "CD");
                record.insert("VDI", "OpaqueRef:vdi-iso");
            } else
            {
                record.insert("type", "Disk");
                record.insert("VDI", "OpaqueRef:NULL");
            }
            return FakeReply::Ok(QVariant(record));
        });
        QSharedPointer<Session> session = OpenFakeSession(server);

        DestroyVmAction action(session.data(), "uuid-vm");
        action.RunSync();

        QCOMPARE(server->CountCalls("VM.hard_shutdown"), 1);
        QCOMPARE(server->CountCalls("VDI.destroy"), 1);
        QCOMPARE(server->CallsTo("VDI.destroy").first().Arg(1), QString("OpaqueRef:vdi-disk"));
        QCOMPARE(server->CallsTo("VM.destroy").first().Arg(1), QString("OpaqueRef:vm"));
        QCOMPARE(server->CalledMethods().last(), QString("VM.destroy"));
    }

    void destroyVm_haltedVmIsNotShutDown()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QVariantMap vms;
        vms.insert("OpaqueRef:vm", MakeVmRecord("web", "uuid-vm", "Halted"));
        server->SetRecords("VM.get_all_records", vms);
        QSharedPointer<Session> session = OpenFakeSession(server);

        DestroyVmAction action(session.data(), "web");
        action.RunSync();

        QCOMPARE(server->CountCalls("VM.hard_shutdown"), 0);
        QCOMPARE(server->CountCalls("VM.destroy"), 1);
    }

    void setTemplate_sendsBoolean()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QVariantMap vms;
        vms.insert("OpaqueRef:vm", MakeVmRecord("golden", "uuid-vm"));
        server->SetRecords("VM.get_all_records", vms);
        QSharedPointer<Session> session = OpenFakeSession(server);

        SetTemplateAction(session.data(), "golden", false).RunSync();

        const RecordedCall call = server->CallsTo("VM.set_is_a_template").first();
        QCOMPARE(call.Arg(1), QString("OpaqueRef:vm"));
        QCOMPARE(call.params.at(2), RpcValue::Boolean(false));
    }

    void operation_cannotRunTwice()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QVariantMap vms;
        vms.insert("OpaqueRef:vm", MakeVmRecord("golden", "uuid-vm"));
        server->SetRecords("VM.get_all_records", vms);
        QSharedPointer<Session> session = OpenFakeSession(server);

        SetTemplateAction action(session.data(), "golden");
        QSignalSpy completed(&action, SIGNAL(completed()));
        action.RunSync();
        QCOMPARE(completed.count(), 1);
        QVERIFY_EXCEPTION_THROWN(action.RunSync(), std::logic_error);
    }

    void waitForIp_skipsMissingGuestMetrics()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        int probes = 0;
        server->On("VM.get_guest_metrics", [&probes](const RpcValueList&)
        {
            ++probes;
            if (probes == 1)
                return FakeReply::Fail(QStringList() << "HANDLE_INVALID");
            if (probes == 2)
                return FakeReply::Ok(RpcValue::String("OpaqueRef:NULL"));
            return FakeReply::Ok(RpcValue::String("OpaqueRef:metrics"));
        });
        server->On("VM_guest_metrics.get_networks", [](const RpcValueList&)
        {
            QVariantMap networks;
            networks.insert("0/ip", "192.168.1.20");
            networks.insert("1/ip", "10.1.1.1");
            return FakeReply::Ok(QVariant(networks));
        });
        QSharedPointer<Session> session = OpenFakeSession(server);

        QCOMPARE(VMHelpers::WaitForIp(session.data(), "OpaqueRef:vm", 5, 1), QString("192.168.1.20"));
        QCOMPARE(probes, 3);
        QCOMPARE(server->CountCalls("VM_guest_metrics.get_networks"), 1);
    }

    void waitForIp_givesUpAfterMaxProbes()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        server->On("VM.get_guest_metrics", [](const RpcValueList&)
        {
            return FakeReply::Ok(RpcValue::String("OpaqueRef:NULL"));
        });
        QSharedPointer<Session> session = OpenFakeSession(server);

        QVERIFY(VMHelpers::WaitForIp(session.data(), "OpaqueRef:vm", 3, 1).isEmpty());
        QCOMPARE(server->CountCalls("VM.get_guest_metrics"), 3);
    }

    void runScript_sendsCommandToGuestAddress()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QVariantMap vms;
        vms.insert("OpaqueRef:vm", MakeVmRecord("web", "uuid-vm", "Running"));
        server->SetRecords("VM.get_all_records", vms);
        serveGuestIp(server, "10.0.0.5");
        QSharedPointer<Session> session = OpenFakeSession(server);

        RunScriptOptions options;
        options.command = "uptime";
        options.user = "admin";
        options.port = 2222;
        options.sudo = true;
        options.ipWaitSeconds = 1;

        FakeRemoteShell shell(3);
        FakeSecretPrompt prompt("hunter2");
        CredentialCache credentials;

        RunScriptAction action(session.data(), "web", options, &shell, &prompt, &credentials);
        action.RunSync();

        QCOMPARE(action.exitCode(), 3);
        QCOMPARE(action.result(), QString("3"));
        QCOMPARE(shell.commands.size(), 1);
        const RemoteCommand command = shell.commands.first();
        QCOMPARE(command.host, QString("10.0.0.5"));
        QCOMPARE(command.user, QString("admin"));
        QCOMPARE(command.port, 2222);
        QCOMPARE(command.password, QString("hunter2"));
        QVERIFY(command.sudo);
        QCOMPARE(command.command, QString("uptime"));
        QCOMPARE(prompt.prompts, QStringList() << "Enter login password: ");
        QCOMPARE(credentials.Password(), QString("hunter2"));

        // The cached password is reused without asking again
        RunScriptAction again(session.data(), "web", options, &shell, &prompt, &credentials);
        again.RunSync();
        QCOMPARE(prompt.prompts.size(), 1);
        QCOMPARE(shell.commands.last().password, QString("hunter2"));
    }

    void runScript_readsScriptFile()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QVariantMap vms;
        vms.insert("OpaqueRef:vm", MakeVmRecord("web", "uuid-vm", "Running"));
        server->SetRecords("VM.get_all_records", vms);
        serveGuestIp(server, "10.0.0.5");
        QSharedPointer<Session> session = OpenFakeSession(server);

        QTemporaryFile script;
        QVERIFY(script.open());
        script.write("#!/bin/sh\necho hello\n");
        script.flush();

        RunScriptOptions options;
        options.script = script.fileName();
        options.ipWaitSeconds = 1;
        FakeRemoteShell shell;

        RunScriptAction action(session.data(), "web", options, &shell, nullptr);
        action.RunSync();

        QCOMPARE(shell.commands.first().command, QString("#!/bin/sh\necho hello\n"));
        QVERIFY(shell.commands.first().password.isNull());
    }

    void runScript_requiresRunningVm()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QVariantMap vms;
        vms.insert("OpaqueRef:vm", MakeVmRecord("web", "uuid-vm", "Halted"));
        server->SetRecords("VM.get_all_records", vms);
        QSharedPointer<Session> session = OpenFakeSession(server);

        RunScriptOptions options;
        options.command = "true";
        FakeRemoteShell shell;

        RunScriptAction action(session.data(), "web", options, &shell, nullptr);
        QVERIFY_EXCEPTION_THROWN(action.RunSync(), Failure);
        QVERIFY(shell.commands.isEmpty());
        QCOMPARE(action.errorMessage(), QString("VM web is not running"));
    }

    void runScript_needsCommandOrScript()
    {
        FakeRemoteShell shell;
        QVERIFY_EXCEPTION_THROWN(RunScriptAction(nullptr, "web", RunScriptOptions(), &shell, nullptr),
                                 std::invalid_argument);
    }

    void sshArguments_passwordAndSudo()
    {
        RemoteCommand command;
        command.host = "10.0.0.5";
        command.user = "admin";
        command.port = 2222;
        command.password = "pw";
        command.sudo = true;
        command.command = "id";

        SshRemoteShell shell;
        QString program;
        const QStringList arguments = shell.BuildArguments(command, &program);

        QCOMPARE(program, QString("sshpass"));
        QCOMPARE(arguments, QStringList() << "-e" << "ssh" << "-o" << "StrictHostKeyChecking=no"
                                          << "-p" << "2222" << "-l" << "admin" << "10.0.0.5"
                                          << "sudo -Sk -p \"\" -- \"$SHELL\"");
        QCOMPARE(SshRemoteShell::BuildStdin(command), QByteArray("pw\nid"));
    }

    void sshArguments_keyLogin()
    {
        RemoteCommand command;
        command.host = "10.0.0.5";
        command.command = "id";

        SshRemoteShell shell;
        QString program;
        const QStringList arguments = shell.BuildArguments(command, &program);

        QCOMPARE(program, QString("ssh"));
        QCOMPARE(arguments, QStringList() << "-o" << "StrictHostKeyChecking=no" << "10.0.0.5" << "\"$SHELL\"");
        QCOMPARE(SshRemoteShell::BuildStdin(command), QByteArray("id"));
    }

    void inventory_listsHostsWithCpuFallback()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QVariantMap host;
        host.insert("name_label", "xen10");
        host.insert("uuid", "uuid-h10");
        host.insert("metrics", "OpaqueRef:hm");
        host.insert("host_CPUs", QVariantList());
        QVariantMap other;
        other.insert("name_label", "xen2");
        other.insert("uuid", "uuid-h2");
        other.insert("host_CPUs", QVariantList() << "OpaqueRef:c9");
        QVariantMap hosts;
        hosts.insert("OpaqueRef:h10", host);
        hosts.insert("OpaqueRef:h2", other);
        server->SetRecords("host.get_all_records", hosts);

        QVariantMap cpus;
        for (int i = 0; i < 4; ++i)
        {
            QVariantMap cpu;
            cpu.insert("host", i < 3 ? "OpaqueRef:h10" : "OpaqueRef:h2");
            cpus.insert(QString("OpaqueRef:c%1").arg(i), cpu);
        }
        server->SetRecords("host_cpu.get_all_records", cpus);
        server->On("host_metrics.get_record", [](const RpcValueList&)
        {
            QVariantMap metrics;
            metrics.insert("memory_total", QString::number(qint64(4) * 1024 * 1024 * 1024));
            metrics.insert("memory_free", QString::number(qint64(1024) * 1024 * 1024));
            return FakeReply::Ok(QVariant(metrics));
        });
        QSharedPointer<Session> session = OpenFakeSession(server);

        const QList<HostSummary> result = Inventory(session.data()).ListHosts();
        QCOMPARE(result.size(), 2);
        QCOMPARE(result.at(0).name, QString("xen2"));
        QCOMPARE(result.at(0).cpus, 1);
        QCOMPARE(result.at(1).name, QString("xen10"));
        QCOMPARE(result.at(1).cpus, 3);
        QCOMPARE(result.at(1).memoryTotal, QString("4.00 GiB"));
        QCOMPARE(result.at(1).memoryFree, QString("1.00 GiB"));
        QCOMPARE(server->CountCalls("host_metrics.get_record"), 1);
    }

    void inventory_separatesVmsAndTemplates()
    {
        QSharedPointer<FakeXenServer> server(new FakeXenServer());
        QVariantMap vms;
        vms.insert("OpaqueRef:1", MakeVmRecord("vm10", "u1"));
        vms.insert("OpaqueRef:2", MakeVmRecord("vm2", "u2"));
        vms.insert("OpaqueRef:3", MakeVmRecord("tmpl-bare", "u3", "Halted", true));
        vms.insert("OpaqueRef:4", MakeVmRecord("tmpl-disk", "u4", "Halted", true, QStringList() << "OpaqueRef:vbd"));
        server->SetRecords("VM.get_all_records", vms);
        QSharedPointer<Session> session = OpenFakeSession(server);

        Inventory inventory(session.data());
        const QList<VmSummary> list = inventory.ListVms();
        QCOMPARE(list.size(), 2);
        QCOMPARE(list.at(0).name, QString("vm2"));
        QCOMPARE(list.at(1).name, QString("vm10"));
        QVERIFY(list.at(0).ip.isEmpty());

        QCOMPARE(inventory.ListTemplates().size(), 2);
        const QList<TemplateSummary> withDisks = inventory.ListTemplates(true);
        QCOMPARE(withDisks.size(), 1);
        QCOMPARE(withDisks.first().ref, QString("OpaqueRef:4"));
    }
};

QTEST_GUILESS_MAIN(WorkflowTests)
#include "test_workflows.moc"
