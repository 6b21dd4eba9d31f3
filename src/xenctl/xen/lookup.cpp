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

#include "lookup.h"
#include "failure.h"
#include "../utils/misc.h"
#include <algorithm>

namespace XenCtl
{
    QStringList RecordLookup::FindMatches(const QVariantMap& records, const QString& key, Filter filter)
    {
        QStringList matches;
        if (key.isEmpty())
            return matches;

        for (auto it = records.constBegin(); it != records.constEnd(); ++it)
        {
            const QVariantMap record = it.value().toMap();
            if (filter && !filter(it.key(), record))
                continue;
            if (record.value("name_label").toString() == key
                || record.value("uuid").toString() == key
                || it.key() == key)
            {
                matches.append(it.key());
            }
        }

        std::sort(matches.begin(), matches.end(), [&records](const QString& a, const QString& b)
        {
            const int cmp = Misc::NaturalCompare(records.value(a).toMap().value("name_label").toString(),
                                                 records.value(b).toMap().value("name_label").toString());
            return cmp != 0 ? cmp < 0 : a < b;
        });

        return matches;
    }

    QString RecordLookup::FindUnique(const QVariantMap& records, const QString& key, const QString& kind,
                                     Filter filter)
    {
        const QStringList matches = FindMatches(records, key, filter);
        if (matches.size() == 1)
            return matches.first();

        QStringList candidates;
        for (const QString& ref : matches)
            candidates.append(DescribeRecord(records.value(ref).toMap()));
        throw LookupError(kind, key, candidates);
    }

    QString RecordLookup::DescribeRecord(const QVariantMap& record)
    {
        return QString("\"%1\" (%2)").arg(record.value("name_label").toString(), record.value("uuid").toString());
    }
}
