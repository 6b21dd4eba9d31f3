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

#include "misc.h"
#include <QtCore/QRegularExpression>
#include <QtCore/QStringList>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace XenCtl
{
    int Misc::NaturalCompare(const QString& s1, const QString& s2)
    {
        if (s1.compare(s2, Qt::CaseInsensitive) == 0)
            return s1.compare(s2);

        if (s1.isEmpty())
            return -1;
        if (s2.isEmpty())
            return 1;

        const int len1 = s1.length();
        const int len2 = s2.length();
        int i = 0;
        int k = 0;

        while (i < len1 && k < len2)
        {
            const bool c1IsDigit = s1[i].isDigit();
            const bool c2IsDigit = s2[k].isDigit();

            if (!c1IsDigit && !c2IsDigit)
            {
                const int cmp = QString(s1[i]).compare(QString(s2[k]), Qt::CaseInsensitive);
                if (cmp != 0)
                    return cmp;
                ++i;
                ++k;
            } else if (c1IsDigit && c2IsDigit)
            {
                int end1 = i;
                while (end1 < len1 && s1[end1].isDigit())
                    ++end1;
                int end2 = k;
                while (end2 < len2 && s2[end2].isDigit())
                    ++end2;

                // Leading zeros do not make a number bigger
                int start1 = i;
                while (start1 < end1 - 1 && s1[start1] == '0')
                    ++start1;
                int start2 = k;
                while (start2 < end2 - 1 && s2[start2] == '0')
                    ++start2;

                const int numLen1 = end1 - start1;
                const int numLen2 = end2 - start2;
                if (numLen1 != numLen2)
                    return numLen1 - numLen2;

                const int cmp = s1.mid(start1, numLen1).compare(s2.mid(start2, numLen2));
                if (cmp != 0)
                    return cmp;

                i = end1;
                k = end2;
            } else
            {
                // One is digit, one is not: digits come after letters
                return c1IsDigit ? 1 : -1;
            }
        }

        return (len1 - i) - (len2 - k);
    }

    qint64 Misc::ParseByteCount(const QString& text)
    {
        static const QRegularExpression pattern("^\\s*([0-9]+(?:\\.[0-9]+)?)\\s*([kKmMgGtT]?)(?:i?[bB])?\\s*$");

        const QRegularExpressionMatch match = pattern.match(text);
        if (!match.hasMatch())
            throw std::invalid_argument(QString("Not a byte count: \"%1\"").arg(text).toStdString());

        const double number = match.captured(1).toDouble();
        const QString suffix = match.captured(2).toUpper();

        double multiplier = 1.0;
        if (suffix == "K")
            multiplier = 1024.0;
        else if (suffix == "M")
            multiplier = 1024.0 * 1024.0;
        else if (suffix == "G")
            multiplier = 1024.0 * 1024.0 * 1024.0;
        else if (suffix == "T")
            multiplier = 1024.0 * 1024.0 * 1024.0 * 1024.0;

        const double bytes = std::round(number * multiplier);
        if (bytes > static_cast<double>(std::numeric_limits<qint64>::max()))
            throw std::invalid_argument(QString("Byte count out of range: \"%1\"").arg(text).toStdString());

        return static_cast<qint64>(bytes);
    }

    QString Misc::FormatBytesIec(qint64 bytes)
    {
        static const QStringList units = QStringList() << "KiB" << "MiB" << "GiB" << "TiB" << "PiB";

        if (bytes < 1024 && bytes > -1024)
            return QString("%1 B").arg(bytes);

        double value = static_cast<double>(bytes);
        int unit = -1;
        while ((value >= 1024.0 || value <= -1024.0) && unit < units.size() - 1)
        {
            value /= 1024.0;
            ++unit;
        }

        return QString("%1 %2").arg(value, 0, 'f', 2).arg(units.at(unit));
    }
}
