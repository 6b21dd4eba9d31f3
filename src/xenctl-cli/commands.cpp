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

#include "commands.h"
#include "settingsmanager.h"
#include <QCommandLineParser>
#include <QDebug>
#include <QJsonDocument>
#include <QVariant>
#include <xenctl/xen/inventory.h>
#include <xenctl/xen/methodcatalog.h>
#include <xenctl/xen/session.h>
#include <xenctl/xen/taskworkflow.h>
#include <xenctl/xen/actions/vm/createvmaction.h>
#include <xenctl/xen/actions/vm/destroyvmaction.h>
#include <xenctl/xen/actions/vm/exportvmaction.h>
#include <xenctl/xen/actions/vm/importvmaction.h>
#include <xenctl/xen/actions/vm/runscriptaction.h>
#include <xenctl/xen/actions/vm/settemplateaction.h>
#include <xenctl/xen/actions/vm/transfervmaction.h>
#include <xenctl/utils/remoteshell.h>
#include <xenctl/utils/secretprompt.h>

using namespace XenCtl;

namespace
{
    // Throws UsageError on unknown options, --help or a wrong number of positional arguments
    QStringList parseArguments(QCommandLineParser& parser, const QString& command, const QStringList& arguments,
                               int minPositional, int maxPositional)
    {
        parser.addHelpOption();
        if (!parser.parse(QStringList() << "xenctl " + command << arguments))
            throw UsageError(parser.errorText());
        if (parser.isSet("help"))
            throw UsageError(parser.helpText());

        const QStringList positional = parser.positionalArguments();
        if (positional.size() < minPositional)
            throw UsageError(QString("%1: missing arguments\n%2").arg(command, parser.helpText()));
        if (maxPositional >= 0 && positional.size() > maxPositional)
            throw UsageError(QString("%1: too many arguments\n%2").arg(command, parser.helpText()));
        return positional;
    }

    QString formatValue(const QVariant& value)
    {
        const int type = value.userType();
        if (type == QMetaType::QVariantMap || type == QMetaType::QVariantList || type == QMetaType::QStringList)
            return QString::fromUtf8(QJsonDocument::fromVariant(value).toJson(QJsonDocument::Indented)).trimmed();
        return value.toString();
    }

    int intValue(const QCommandLineParser& parser, const QString& name)
    {
        bool ok = false;
        const int value = parser.value(name).toInt(&ok);
        if (!ok || value < 0)
            throw UsageError(QString("--%1 expects a positive number").arg(name));
        return value;
    }
}

Commands::Commands(const ConnectionOptions& connection, QTextStream& out)
    : m_connection(connection), m_out(out)
{
}

QStringList Commands::Names()
{
    return QStringList() << "methods" << "call" << "list-vms" << "list-templates" << "list-hosts"
                         << "create-vm" << "destroy-vm" << "import" << "export" << "transfer"
                         << "set-template" << "run";
}

QString Commands::Usage()
{
    return "Commands:\n"
           "  methods [namespace]                      List remote methods\n"
           "  call <Namespace.method> [args...]         Call a remote method with string arguments\n"
           "  list-vms                                 List VMs\n"
           "  list-templates [--with-disks]            List templates\n"
           "  list-hosts                               List physical hosts\n"
           "  create-vm --name N --template T [--cpus N] [--memory SIZE] [--no-wait-ip]\n"
           "  destroy-vm <vm>                          Destroy a VM and its disks\n"
           "  import <file> [--sr SR]                  Import a VM from an XVA file\n"
           "  export <vm> <file>                       Export a VM to an XVA file\n"
           "  transfer <vm> --dest-host H [--dest-user U] [--sr SR]\n"
           "  set-template <vm> [--unset]              Mark a VM as template\n"
           "  run <vm> (--script FILE | --command CMD) [--ssh-user U] [--ssh-port P] [--sudo] [--ask-password]\n";
}

int Commands::Run(const QString& command, const QStringList& arguments)
{
    if (command == "methods")
        return this->methods(arguments);
    if (command == "call")
        return this->call(arguments);
    if (command == "list-vms")
        return this->listVms(arguments);
    if (command == "list-templates")
        return this->listTemplates(arguments);
    if (command == "list-hosts")
        return this->listHosts(arguments);
    if (command == "create-vm")
        return this->createVm(arguments);
    if (command == "destroy-vm")
        return this->destroyVm(arguments);
    if (command == "import")
        return this->importVm(arguments);
    if (command == "export")
        return this->exportVm(arguments);
    if (command == "transfer")
        return this->transferVm(arguments);
    if (command == "set-template")
        return this->setTemplate(arguments);
    if (command == "run")
        return this->runScript(arguments);

    throw UsageError(QString("Unknown command \"%1\"\n%2").arg(command, Usage()));
}

QSharedPointer<Session> Commands::openSession(const QString& host, const QString& user)
{
    if (host.isEmpty())
        throw UsageError("No xen server given, use -H or Connection/Host in the configuration file");

    TerminalSecretPrompt prompt;
    return Session::Open(host, user.isEmpty() ? QString("root") : user, QString(), &prompt);
}

QSharedPointer<Session> Commands::openSession()
{
    const SettingsManager& settings = SettingsManager::instance();
    const QString host = this->m_connection.host.isEmpty() ? settings.getHost() : this->m_connection.host;
    const QString user = this->m_connection.user.isEmpty() ? settings.getUser() : this->m_connection.user;
    return this->openSession(host, user);
}

PollOptions Commands::pollOptions() const
{
    PollOptions options;
    options.intervalMs = SettingsManager::instance().getPollIntervalMs();
    options.maxAttempts = SettingsManager::instance().getMaxPollAttempts();
    return options;
}

int Commands::methods(const QStringList& arguments)
{
    QCommandLineParser parser;
    parser.addPositionalArgument("namespace", "Only list this namespace", "[namespace]");
    const QStringList positional = parseArguments(parser, "methods", arguments, 0, 1);

    QSharedPointer<Session> session = this->openSession();
    if (positional.isEmpty())
    {
        QStringList methods = session->GetCatalog().Methods();
        methods.sort();
        for (const QString& method : methods)
            this->m_out << method << "\n";
        return 0;
    }

    const ApiNamespace ns = session->Namespace(positional.first());
    QStringList methods = ns.AdvertisedMethods();
    methods.sort();
    for (const QString& method : methods)
        this->m_out << ns.GetName() << "." << method << "\n";
    return 0;
}

int Commands::call(const QStringList& arguments)
{
    QCommandLineParser parser;
    parser.addPositionalArgument("method", "Namespace.method", "<Namespace.method>");
    parser.addPositionalArgument("args", "String arguments, after the session", "[args...]");
    const QStringList positional = parseArguments(parser, "call", arguments, 1, -1);

    const QPair<QString, QString> name = MethodCatalog::SplitMethodName(positional.first());
    if (name.first.isEmpty())
        throw UsageError(QString("\"%1\" is not of the form Namespace.method").arg(positional.first()));

    RpcValueList args;
    for (int i = 1; i < positional.size(); ++i)
        args.append(RpcValue::String(positional.at(i)));

    QSharedPointer<Session> session = this->openSession();
    const QVariant result = session->Namespace(name.first).Call(name.second, args);
    this->m_out << formatValue(result) << "\n";
    return 0;
}

int Commands::listVms(const QStringList& arguments)
{
    QCommandLineParser parser;
    parseArguments(parser, "list-vms", arguments, 0, 0);

    QSharedPointer<Session> session = this->openSession();
    Inventory inventory(session.data());
    for (const VmSummary& vm : inventory.ListVms())
    {
        this->m_out << QString("%1 %2 %3 %4").arg(vm.name, -32).arg(vm.uuid, -36).arg(vm.powerState, -10).arg(vm.ip)
                           .trimmed()
                    << "\n";
    }
    return 0;
}

int Commands::listTemplates(const QStringList& arguments)
{
    QCommandLineParser parser;
    QCommandLineOption withDisks("with-disks", "Only templates with at least one disk");
    parser.addOption(withDisks);
    parseArguments(parser, "list-templates", arguments, 0, 0);

    QSharedPointer<Session> session = this->openSession();
    Inventory inventory(session.data());
    for (const TemplateSummary& tmpl : inventory.ListTemplates(parser.isSet(withDisks)))
        this->m_out << QString("%1 %2").arg(tmpl.name, -48).arg(tmpl.uuid) << "\n";
    return 0;
}

int Commands::listHosts(const QStringList& arguments)
{
    QCommandLineParser parser;
    parseArguments(parser, "list-hosts", arguments, 0, 0);

    QSharedPointer<Session> session = this->openSession();
    Inventory inventory(session.data());
    for (const HostSummary& host : inventory.ListHosts())
    {
        this->m_out << QString("%1 %2 cpus: %3 memory: %4 free of %5")
                           .arg(host.name, -24).arg(host.uuid).arg(host.cpus).arg(host.memoryFree, host.memoryTotal)
                    << "\n";
    }
    return 0;
}

int Commands::createVm(const QStringList& arguments)
{
    QCommandLineParser parser;
    QCommandLineOption name("name", "Name of the new VM", "name");
    QCommandLineOption templateName("template", "Template name, uuid or ref", "template");
    QCommandLineOption cpus("cpus", "Number of VCPUs", "count");
    QCommandLineOption memory("memory", "Memory size, e.g. 2G", "size");
    QCommandLineOption noWaitIp("no-wait-ip", "Do not wait for the guest IP address");
    parser.addOption(name);
    parser.addOption(templateName);
    parser.addOption(cpus);
    parser.addOption(memory);
    parser.addOption(noWaitIp);
    parseArguments(parser, "create-vm", arguments, 0, 0);

    if (!parser.isSet(name) || !parser.isSet(templateName))
        throw UsageError("create-vm needs --name and --template");

    const int cpuCount = parser.isSet(cpus) ? intValue(parser, "cpus") : 0;
    const int ipWait = parser.isSet(noWaitIp) ? 0 : SettingsManager::instance().getIpWaitSeconds();

    QSharedPointer<Session> session = this->openSession();
    CreateVmAction action(session.data(), parser.value(name), parser.value(templateName), cpuCount,
                          parser.value(memory), ipWait);
    action.RunSync();

    this->m_out << action.vmRef() << "\n";
    return 0;
}

int Commands::destroyVm(const QStringList& arguments)
{
    QCommandLineParser parser;
    parser.addPositionalArgument("vm", "VM name, uuid or ref", "<vm>");
    const QStringList positional = parseArguments(parser, "destroy-vm", arguments, 1, 1);

    QSharedPointer<Session> session = this->openSession();
    DestroyVmAction action(session.data(), positional.first());
    action.RunSync();
    return 0;
}

int Commands::importVm(const QStringList& arguments)
{
    QCommandLineParser parser;
    QCommandLineOption sr("sr", "Storage repository name, uuid or ref", "sr");
    parser.addOption(sr);
    parser.addPositionalArgument("file", "XVA file", "<file>");
    const QStringList positional = parseArguments(parser, "import", arguments, 1, 1);

    QSharedPointer<Session> session = this->openSession();
    ImportVmAction action(session.data(), positional.first(), parser.value(sr));
    action.setPollOptions(this->pollOptions());
    action.RunSync();

    if (!action.result().isEmpty())
        this->m_out << action.result() << "\n";
    return 0;
}

int Commands::exportVm(const QStringList& arguments)
{
    QCommandLineParser parser;
    parser.addPositionalArgument("vm", "VM name, uuid or ref", "<vm>");
    parser.addPositionalArgument("file", "XVA file to write", "<file>");
    const QStringList positional = parseArguments(parser, "export", arguments, 2, 2);

    QSharedPointer<Session> session = this->openSession();
    ExportVmAction action(session.data(), positional.at(0), positional.at(1));
    action.setPollOptions(this->pollOptions());
    action.RunSync();
    return 0;
}

int Commands::transferVm(const QStringList& arguments)
{
    QCommandLineParser parser;
    QCommandLineOption destHost("dest-host", "Destination xen server", "host");
    QCommandLineOption destUser("dest-user", "User on the destination server", "user");
    QCommandLineOption sr("sr", "Storage repository on the destination", "sr");
    parser.addOption(destHost);
    parser.addOption(destUser);
    parser.addOption(sr);
    parser.addPositionalArgument("vm", "VM name, uuid or ref", "<vm>");
    const QStringList positional = parseArguments(parser, "transfer", arguments, 1, 1);

    if (!parser.isSet(destHost))
        throw UsageError("transfer needs --dest-host");

    QSharedPointer<Session> source = this->openSession();
    const QString user = parser.isSet(destUser) ? parser.value(destUser) : SettingsManager::instance().getUser();
    QSharedPointer<Session> destination = this->openSession(parser.value(destHost), user);

    TransferVmAction action(source.data(), positional.first(), destination.data(), parser.value(sr));
    action.setPollOptions(this->pollOptions());
    action.RunSync();
    return 0;
}

int Commands::setTemplate(const QStringList& arguments)
{
    QCommandLineParser parser;
    QCommandLineOption unset("unset", "Turn the template back into a VM");
    parser.addOption(unset);
    parser.addPositionalArgument("vm", "VM name, uuid or ref", "<vm>");
    const QStringList positional = parseArguments(parser, "set-template", arguments, 1, 1);

    QSharedPointer<Session> session = this->openSession();
    SetTemplateAction action(session.data(), positional.first(), !parser.isSet(unset));
    action.RunSync();
    return 0;
}

int Commands::runScript(const QStringList& arguments)
{
    const SettingsManager& settings = SettingsManager::instance();

    QCommandLineParser parser;
    QCommandLineOption script("script", "Local script file to run", "file");
    QCommandLineOption command("command", "Command to run", "command");
    QCommandLineOption sshUser("ssh-user", "SSH login on the guest", "user");
    QCommandLineOption sshPort("ssh-port", "SSH port on the guest", "port");
    QCommandLineOption sudo("sudo", "Run through sudo");
    QCommandLineOption askPassword("ask-password", "Prompt for the SSH password");
    parser.addOption(script);
    parser.addOption(command);
    parser.addOption(sshUser);
    parser.addOption(sshPort);
    parser.addOption(sudo);
    parser.addOption(askPassword);
    parser.addPositionalArgument("vm", "VM name, uuid or ref", "<vm>");
    const QStringList positional = parseArguments(parser, "run", arguments, 1, 1);

    if (parser.isSet(script) == parser.isSet(command))
        throw UsageError("run needs exactly one of --script and --command");

    RunScriptOptions options;
    if (parser.isSet(script))
        options.script = parser.value(script);
    if (parser.isSet(command))
        options.command = parser.value(command);
    options.user = parser.isSet(sshUser) ? parser.value(sshUser) : settings.getSshUser();
    options.port = parser.isSet(sshPort) ? intValue(parser, "ssh-port") : settings.getSshPort();
    options.sudo = parser.isSet(sudo);
    options.askPassword = parser.isSet(askPassword);
    options.ipWaitSeconds = settings.getIpWaitSeconds();

    QSharedPointer<Session> session = this->openSession();
    SshRemoteShell shell;
    TerminalSecretPrompt prompt;
    CredentialCache credentials;

    RunScriptAction action(session.data(), positional.first(), options, &shell, &prompt, &credentials);
    action.RunSync();

    if (action.exitCode() != 0)
    {
        qWarning().noquote() << "Remote command exited with status" << action.exitCode();
        return 1;
    }
    return 0;
}
