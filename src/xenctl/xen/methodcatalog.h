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

#ifndef XENCTL_METHODCATALOG_H
#define XENCTL_METHODCATALOG_H

#include "../xenctl_global.h"
#include <QtCore/QMap>
#include <QtCore/QPair>
#include <QtCore/QStringList>

namespace XenCtl
{
    /**
     * @brief Snapshot of the method names advertised by system.listMethods
     *
     * Immutable once built. Methods are grouped by namespace, which is
     * everything before the last dot ("VM_guest_metrics.get_networks" ->
     * "VM_guest_metrics"). A purely numeric trailing segment is a version
     * qualifier and is dropped before splitting.
     */
    class XENCTL_EXPORT MethodCatalog
    {
        public:
            MethodCatalog() {}
            explicit MethodCatalog(const QStringList& methods);

            // {namespace, method}; namespace is empty for undotted names
            static QPair<QString, QString> SplitMethodName(const QString& fullName);

            const QStringList& Methods() const { return this->m_methods; }
            QStringList Namespaces() const { return this->m_namespaces.keys(); }
            QStringList MethodsIn(const QString& ns) const { return this->m_namespaces.value(ns); }
            bool HasNamespace(const QString& ns) const { return this->m_namespaces.contains(ns); }
            bool Contains(const QString& fullName) const { return this->m_methods.contains(fullName); }
            bool IsEmpty() const { return this->m_methods.isEmpty(); }

        private:
            QStringList m_methods;
            QMap<QString, QStringList> m_namespaces;
    };
}

#endif // XENCTL_METHODCATALOG_H
