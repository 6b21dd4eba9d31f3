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

#ifndef XENCTL_SESSION_H
#define XENCTL_SESSION_H

#include "../xenctl_global.h"
#include "methodcatalog.h"
#include "namespaceresolver.h"
#include "rpcvalue.h"
#include <QtCore/QObject>
#include <QtCore/QSharedPointer>
#include <QtCore/QString>
#include <QtCore/QUrl>
#include <QtCore/QVariant>

namespace XenCtl
{
    class RpcGateway;
    class RpcTransport;
    class SecretPrompt;

    /**
     * @brief Authenticated connection to one xapi endpoint
     *
     * Holds the session token returned by session.login_with_password and
     * prepends it to every gated call. The token never changes after login,
     * so one session may be used from several threads.
     */
    class XENCTL_EXPORT Session : public QObject
    {
        Q_OBJECT
        public:
            /**
             * @param endpoint "host", "host:port" or a full URI; http is assumed without a scheme
             * @param transport Injected transport, an HttpRpcTransport to the endpoint when null
             */
            explicit Session(const QString& endpoint,
                             const QSharedPointer<RpcTransport>& transport = QSharedPointer<RpcTransport>(),
                             QObject* parent = nullptr);
            ~Session();

            /**
             * @brief Connect, discover the API and log in
             *
             * When password is a null string it is read through prompt (a
             * TerminalSecretPrompt when prompt is null).
             * @throws AuthError when the server rejects the credentials
             */
            static QSharedPointer<Session> Open(const QString& endpoint,
                                                const QString& username = "root",
                                                const QString& password = QString(),
                                                SecretPrompt* prompt = nullptr,
                                                const QSharedPointer<RpcTransport>& transport = QSharedPointer<RpcTransport>());

            static QUrl NormalizeUri(const QString& endpoint);

            // Fetches system.listMethods and resolves the namespaces; called by Login
            void Discover();

            void Login(const QString& username, const QString& password, SecretPrompt* prompt = nullptr);
            bool IsLoggedIn() const;

            /**
             * @brief Gated call, the session token is passed as first argument
             * @throws RemoteError when the server returns a non-success status
             */
            QVariant Call(const QString& method, const RpcValueList& args = RpcValueList());

            // Same as Call, method given as "Namespace.method"
            QVariant Invoke(const QString& fullMethod, const RpcValueList& args = RpcValueList());

            /**
             * @brief Namespace dispatcher bound to this session
             * @throws LookupError when the namespace is not in the catalog
             */
            ApiNamespace Namespace(const QString& name);

            QString GetSessionId() const;
            QString GetUsername() const;
            QUrl GetUri() const;
            QString GetHost() const;
            const MethodCatalog& GetCatalog() const;
            RpcGateway* GetGateway() const;

        signals:
            void loginSuccessful();
            void loginFailed(const QString& reason);

        private:
            class Private;
            Private* d;
    };
}

#endif // XENCTL_SESSION_H
