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

#ifndef XENCTL_MISC_H
#define XENCTL_MISC_H

#include "../xenctl_global.h"
#include <QtCore/QString>

namespace XenCtl
{
    class XENCTL_EXPORT Misc
    {
        public:
            /**
             * @brief Natural string comparison
             *
             * Compares strings in a way that handles embedded numbers naturally.
             * E.g., "VM2" < "VM10" (unlike alphabetical where "VM10" < "VM2")
             *
             * @return Negative if s1 < s2, 0 if equal, positive if s1 > s2
             */
            static int NaturalCompare(const QString& s1, const QString& s2);

            /**
             * @brief Parse a byte count written with a binary suffix
             *
             * "16G", "512M", "1.5g", "64k", "2T" and plain numbers are accepted;
             * suffixes are powers of 1024 and may be followed by "B" or "iB".
             * @throws std::invalid_argument when the text is not a byte count
             */
            static qint64 ParseByteCount(const QString& text);

            // "1.50 GiB", "512 B"
            static QString FormatBytesIec(qint64 bytes);

        private:
            Misc() = delete;
    };
}

#endif // XENCTL_MISC_H
