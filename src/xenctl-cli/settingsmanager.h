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

#ifndef XENCTL_CLI_SETTINGSMANAGER_H
#define XENCTL_CLI_SETTINGSMANAGER_H

#include <QObject>
#include <QSettings>
#include <QString>

/**
 * @brief Settings of the command line front end
 *
 * INI file, $XDG_CONFIG_HOME/xenctl/xenctl.ini unless SetConfigFile was
 * called before the first use of instance().
 */
class SettingsManager : public QObject
{
    Q_OBJECT

    public:
        static SettingsManager& instance();

        static void SetConfigFile(const QString& path);
        QString fileName() const;

        // Connection
        QString getHost() const;
        void setHost(const QString& host);
        QString getUser() const;
        void setUser(const QString& user);

        // Task polling
        int getPollIntervalMs() const;
        int getMaxPollAttempts() const;

        // Guest access
        int getIpWaitSeconds() const;
        QString getSshUser() const;
        int getSshPort() const;

        void sync();

    private:
        explicit SettingsManager(QObject* parent = nullptr);
        ~SettingsManager();

        SettingsManager(const SettingsManager&) = delete;
        SettingsManager& operator=(const SettingsManager&) = delete;

        QSettings* m_settings;

        static QString s_configFile;
};

#endif // XENCTL_CLI_SETTINGSMANAGER_H
