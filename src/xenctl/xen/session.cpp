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

#include "session.h"
#include "api.h"
#include "failure.h"
#include "network/httprpctransport.h"
#include "../utils/secretprompt.h"
#include <QtCore/QDebug>
#include <stdexcept>

namespace XenCtl
{
    class Session::Private
    {
        public:
            QUrl uri;
            QString username;
            QString sessionId;
            MethodCatalog catalog;
            NamespaceResolver resolver;
            QSharedPointer<RpcTransport> transport;
            RpcGateway* gateway = nullptr;
    };

    Session::Session(const QString& endpoint, const QSharedPointer<RpcTransport>& transport, QObject* parent)
        : QObject(parent), d(new Private())
    {
        this->d->uri = NormalizeUri(endpoint);
        this->d->transport = transport;
        if (!this->d->transport)
            this->d->transport = QSharedPointer<RpcTransport>(new HttpRpcTransport(this->d->uri));
        this->d->gateway = new RpcGateway(this->d->transport, this->d->uri.toString());
    }

    Session::~Session()
    {
        delete this->d->gateway;
        delete this->d;
    }

    QSharedPointer<Session> Session::Open(const QString& endpoint, const QString& username,
                                          const QString& password, SecretPrompt* prompt,
                                          const QSharedPointer<RpcTransport>& transport)
    {
        QSharedPointer<Session> session(new Session(endpoint, transport));
        session->Login(username, password, prompt);
        return session;
    }

    QUrl Session::NormalizeUri(const QString& endpoint)
    {
        QString text = endpoint.trimmed();
        if (!text.contains("://"))
            text = "http://" + text;

        QUrl uri(text);
        if (!uri.isValid() || uri.host().isEmpty())
            throw std::invalid_argument(QString("Invalid xen server address: %1").arg(endpoint).toStdString());
        return uri;
    }

    void Session::Discover()
    {
        const QVariant methods = this->d->gateway->CallRaw("system.listMethods");
        this->d->catalog = MethodCatalog(methods.toStringList());
        const int added = this->d->resolver.Resolve(this->d->catalog);
        qDebug() << "Session:" << this->d->catalog.Methods().size() << "methods," << added
                 << "namespaces at" << this->d->uri.host();
    }

    void Session::Login(const QString& username, const QString& password, SecretPrompt* prompt)
    {
        this->Discover();

        QString secret = password;
        if (secret.isNull())
        {
            TerminalSecretPrompt terminalPrompt;
            SecretPrompt* source = prompt ? prompt : &terminalPrompt;
            secret = source->ReadSecret(QString("Enter xen admin password for %1: ").arg(this->d->uri.toString()));
            if (secret.isNull())
                throw Failure("No password given");
        }

        this->d->username = username;
        try
        {
            const QVariant token = this->d->gateway->Call("session.login_with_password",
                                                          RpcValueList() << RpcValue::String(username)
                                                                         << RpcValue::String(secret));
            this->d->sessionId = token.toString();
        } catch (const RemoteError& error)
        {
            qWarning() << "Session: login as" << username << "to" << this->d->uri.host() << "failed:" << error.status();
            emit this->loginFailed(error.message());
            throw AuthError(this->d->uri.toString(), username, error.status(), error.errorDescription());
        }

        qDebug() << "Session: logged in to" << this->d->uri.host() << "session" << this->d->sessionId.left(16) + "...";
        emit this->loginSuccessful();
    }

    bool Session::IsLoggedIn() const
    {
        return !this->d->sessionId.isEmpty();
    }

    QVariant Session::Call(const QString& method, const RpcValueList& args)
    {
        if (!this->IsLoggedIn())
            throw Failure(QString("Not logged in to %1").arg(this->d->uri.toString()),
                          QStringList() << Failure::SESSION_INVALID);

        RpcValueList gated;
        gated.reserve(args.size() + 1);
        gated.append(RpcValue::String(this->d->sessionId));
        gated.append(args);
        return this->d->gateway->Call(method, gated);
    }

    QVariant Session::Invoke(const QString& fullMethod, const RpcValueList& args)
    {
        return this->Call(fullMethod, args);
    }

    ApiNamespace Session::Namespace(const QString& name)
    {
        return this->d->resolver.Bind(this, name);
    }

    QString Session::GetSessionId() const
    {
        return this->d->sessionId;
    }

    QString Session::GetUsername() const
    {
        return this->d->username;
    }

    QUrl Session::GetUri() const
    {
        return this->d->uri;
    }

    QString Session::GetHost() const
    {
        return this->d->uri.host();
    }

    const MethodCatalog& Session::GetCatalog() const
    {
        return this->d->catalog;
    }

    RpcGateway* Session::GetGateway() const
    {
        return this->d->gateway;
    }
}
