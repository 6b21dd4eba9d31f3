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

#ifndef XENCTL_LOOKUP_H
#define XENCTL_LOOKUP_H

#include "../xenctl_global.h"
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariantMap>
#include <functional>

namespace XenCtl
{
    /**
     * @brief Deterministic lookup in a get_all_records result
     *
     * A record matches when the key equals its name_label, its uuid or its
     * opaque ref. Exactly one match is required, nothing is ever picked at
     * random.
     */
    class XENCTL_EXPORT RecordLookup
    {
        public:
            using Filter = std::function<bool(const QString& ref, const QVariantMap& record)>;

            // All matching refs, ordered by name
            static QStringList FindMatches(const QVariantMap& records, const QString& key,
                                           Filter filter = nullptr);

            /**
             * @param records Map of ref -> record
             * @param kind Object kind used in error messages ("VM", "template", "storage repository")
             * @throws LookupError on zero or several matches
             */
            static QString FindUnique(const QVariantMap& records, const QString& key, const QString& kind,
                                      Filter filter = nullptr);

            // "name" (uuid)
            static QString DescribeRecord(const QVariantMap& record);

        private:
            RecordLookup() = delete;
    };
}

#endif // XENCTL_LOOKUP_H
