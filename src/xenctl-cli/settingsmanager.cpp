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

#include "settingsmanager.h"
#include <QDebug>
#include <xenctl/xen/taskworkflow.h>
#include <xenctl/xen/vmhelpers.h>

QString SettingsManager::s_configFile;

SettingsManager::SettingsManager(QObject* parent)
    : QObject(parent), m_settings(nullptr)
{
    if (SettingsManager::s_configFile.isEmpty())
        this->m_settings = new QSettings(QSettings::IniFormat, QSettings::UserScope, "xenctl", "xenctl", this);
    else
        this->m_settings = new QSettings(SettingsManager::s_configFile, QSettings::IniFormat, this);

    qDebug() << "Settings file location:" << this->m_settings->fileName();
}

SettingsManager::~SettingsManager()
{
}

SettingsManager& SettingsManager::instance()
{
    static SettingsManager instance;
    return instance;
}

void SettingsManager::SetConfigFile(const QString& path)
{
    SettingsManager::s_configFile = path;
}

QString SettingsManager::fileName() const
{
    return this->m_settings->fileName();
}

QString SettingsManager::getHost() const
{
    return this->m_settings->value("Connection/Host").toString();
}

void SettingsManager::setHost(const QString& host)
{
    this->m_settings->setValue("Connection/Host", host);
}

QString SettingsManager::getUser() const
{
    return this->m_settings->value("Connection/User", "root").toString();
}

void SettingsManager::setUser(const QString& user)
{
    this->m_settings->setValue("Connection/User", user);
}

int SettingsManager::getPollIntervalMs() const
{
    return this->m_settings->value("Tasks/PollIntervalMs", XenCtl::PollOptions::DEFAULT_INTERVAL_MS).toInt();
}

int SettingsManager::getMaxPollAttempts() const
{
    return this->m_settings->value("Tasks/MaxPollAttempts", XenCtl::PollOptions::DEFAULT_MAX_ATTEMPTS).toInt();
}

int SettingsManager::getIpWaitSeconds() const
{
    return this->m_settings->value("Guest/IpWaitSeconds", XenCtl::VMHelpers::DEFAULT_IP_WAIT_SECONDS).toInt();
}

QString SettingsManager::getSshUser() const
{
    return this->m_settings->value("Ssh/User").toString();
}

int SettingsManager::getSshPort() const
{
    return this->m_settings->value("Ssh/Port", 0).toInt();
}

void SettingsManager::sync()
{
    this->m_settings->sync();
}
