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

#include "methodcatalog.h"

namespace XenCtl
{
    MethodCatalog::MethodCatalog(const QStringList& methods) : m_methods(methods)
    {
        for (const QString& method : methods)
        {
            const QPair<QString, QString> split = SplitMethodName(method);
            if (split.first.isEmpty())
                continue;
            QStringList& names = this->m_namespaces[split.first];
            if (!names.contains(split.second))
                names.append(split.second);
        }
    }

    QPair<QString, QString> MethodCatalog::SplitMethodName(const QString& fullName)
    {
        QStringList parts = fullName.split('.');

        bool numeric = false;
        if (parts.size() > 2)
        {
            parts.last().toInt(&numeric);
            if (numeric)
                parts.removeLast();
        }

        if (parts.size() < 2)
            return qMakePair(QString(), fullName);

        const QString method = parts.takeLast();
        return qMakePair(parts.join('.'), method);
    }
}
