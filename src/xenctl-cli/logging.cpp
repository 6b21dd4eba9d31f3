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

#include "logging.h"
#include <QDateTime>
#include <QMutex>
#include <QMutexLocker>
#include <cstdio>

QtMessageHandler Logging::s_originalHandler = nullptr;
bool Logging::s_verbose = false;
bool Logging::s_installed = false;

namespace
{
    QMutex s_mutex;
}

void Logging::Install(bool verbose)
{
    QMutexLocker locker(&s_mutex);
    Logging::s_verbose = verbose;
    if (!Logging::s_installed)
    {
        Logging::s_originalHandler = qInstallMessageHandler(Logging::messageHandler);
        Logging::s_installed = true;
    }
}

void Logging::Uninstall()
{
    QMutexLocker locker(&s_mutex);
    if (Logging::s_installed)
    {
        // A null handler restores the default one
        qInstallMessageHandler(Logging::s_originalHandler);
        Logging::s_originalHandler = nullptr;
        Logging::s_installed = false;
    }
}

QString Logging::FormatMessage(QtMsgType type, const QString& msg)
{
    QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    QString typeStr;

    switch (type)
    {
        case QtDebugMsg:
            typeStr = "DEBUG";
            break;
        case QtInfoMsg:
            typeStr = "INFO ";
            break;
        case QtWarningMsg:
            typeStr = "WARN ";
            break;
        case QtCriticalMsg:
            typeStr = "ERROR";
            break;
        case QtFatalMsg:
            typeStr = "FATAL";
            break;
    }

    return QString("%1 %2 %3").arg(timestamp, typeStr, msg);
}

void Logging::messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
    Q_UNUSED(context);

    if (type == QtDebugMsg && !Logging::s_verbose)
        return;

    QMutexLocker locker(&s_mutex);
    const QByteArray line = FormatMessage(type, msg).toLocal8Bit();
    fprintf(stderr, "%s\n", line.constData());
    fflush(stderr);
}
