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

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>
#include <cstdio>
#include <xenctl/xenctl_global.h>
#include <xenctl/xen/failure.h>
#include "commands.h"
#include "logging.h"
#include "settingsmanager.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("xenctl");
    QCoreApplication::setApplicationVersion(XENCTL_VERSION);
    QCoreApplication::setOrganizationName("xenctl");

    QTextStream out(stdout);
    QTextStream err(stderr);

    QCommandLineParser parser;
    parser.setApplicationDescription("Command line client for XenServer / XCP-ng\n\n" + Commands::Usage());
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);

    QCommandLineOption hostOption(QStringList() << "H" << "host", "Xen server to connect to.", "host");
    QCommandLineOption userOption(QStringList() << "u" << "user", "User name (default root).", "user");
    QCommandLineOption confOption(QStringList() << "c" << "conf", "Use alternative configuration file.", "path");
    QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Print debug messages.");
    QCommandLineOption versionOption(QStringList() << "V" << "version", "Print version and exit.");
    parser.addOption(hostOption);
    parser.addOption(userOption);
    parser.addOption(confOption);
    parser.addOption(verboseOption);
    parser.addOption(versionOption);
    parser.addHelpOption();
    parser.addPositionalArgument("command", "Command to run.", "<command> [args...]");

    if (!parser.parse(app.arguments()))
    {
        err << parser.errorText() << "\n";
        return 2;
    }

    if (parser.isSet("help"))
    {
        out << parser.helpText();
        return 0;
    }

    if (parser.isSet(versionOption))
    {
        out << app.applicationName() << " " << app.applicationVersion() << "\n";
        return 0;
    }

    Logging::Install(parser.isSet(verboseOption));

    if (parser.isSet(confOption))
        SettingsManager::SetConfigFile(parser.value(confOption));

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty())
    {
        err << parser.helpText();
        return 2;
    }

    const QString command = positional.takeFirst();

    ConnectionOptions connection;
    connection.host = parser.value(hostOption);
    connection.user = parser.value(userOption);

    int status = 1;
    try
    {
        Commands commands(connection, out);
        status = commands.Run(command, positional);
    } catch (const UsageError& e)
    {
        out.flush();
        err << e.what() << "\n";
        status = 2;
    } catch (const XenCtl::Failure& e)
    {
        out.flush();
        err << e.message() << "\n";
        status = 1;
    } catch (const std::exception& e)
    {
        out.flush();
        err << e.what() << "\n";
        status = 1;
    }

    out.flush();
    err.flush();
    Logging::Uninstall();
    return status;
}
