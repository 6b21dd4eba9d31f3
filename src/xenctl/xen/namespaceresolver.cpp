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

#include "namespaceresolver.h"
#include "failure.h"
#include "methodcatalog.h"
#include "session.h"

namespace XenCtl
{
    ApiNamespace::ApiNamespace(Session* session, const QString& name, const QStringList& advertisedMethods)
        : m_session(session), m_name(name), m_advertisedMethods(advertisedMethods)
    {
    }

    QVariant ApiNamespace::Call(const QString& method, const RpcValueList& args) const
    {
        return this->m_session->Call(this->m_name + "." + method, args);
    }

    int NamespaceResolver::Resolve(const MethodCatalog& catalog)
    {
        int added = 0;
        for (const QString& name : catalog.Namespaces())
        {
            QStringList& methods = this->m_namespaces[name];
            if (methods.isEmpty())
                ++added;
            for (const QString& method : catalog.MethodsIn(name))
            {
                if (!methods.contains(method))
                    methods.append(method);
            }
        }
        return added;
    }

    ApiNamespace NamespaceResolver::Bind(Session* session, const QString& name) const
    {
        if (!this->m_namespaces.contains(name))
            throw LookupError("namespace", name);
        return ApiNamespace(session, name, this->m_namespaces.value(name));
    }
}
