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

#ifndef XENCTL_NAMESPACERESOLVER_H
#define XENCTL_NAMESPACERESOLVER_H

#include "../xenctl_global.h"
#include "rpcvalue.h"
#include <QtCore/QMap>
#include <QtCore/QStringList>
#include <QtCore/QVariant>

namespace XenCtl
{
    class MethodCatalog;
    class Session;

    /**
     * @brief A remote namespace bound to one session
     *
     * Any method name is accepted and forwarded as "<namespace>.<method>"
     * with the session token prepended; only the server decides whether
     * it exists.
     *
     * @code
     * session->Namespace("VM").Call("get_all_records");
     * @endcode
     */
    class XENCTL_EXPORT ApiNamespace
    {
        public:
            ApiNamespace(Session* session, const QString& name, const QStringList& advertisedMethods);

            QVariant Call(const QString& method, const RpcValueList& args = RpcValueList()) const;

            QString GetName() const { return this->m_name; }
            const QStringList& AdvertisedMethods() const { return this->m_advertisedMethods; }
            bool Advertises(const QString& method) const { return this->m_advertisedMethods.contains(method); }

        private:
            Session* m_session;
            QString m_name;
            QStringList m_advertisedMethods;
    };

    /**
     * @brief Registry of the namespaces made callable from a method catalog
     */
    class XENCTL_EXPORT NamespaceResolver
    {
        public:
            // Registering the same catalog again is a no-op; returns the number of new namespaces
            int Resolve(const MethodCatalog& catalog);

            bool IsResolved(const QString& name) const { return this->m_namespaces.contains(name); }
            QStringList Namespaces() const { return this->m_namespaces.keys(); }

            // @throws LookupError when the namespace was never advertised
            ApiNamespace Bind(Session* session, const QString& name) const;

        private:
            QMap<QString, QStringList> m_namespaces;
    };
}

#endif // XENCTL_NAMESPACERESOLVER_H
