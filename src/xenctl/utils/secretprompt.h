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

#ifndef XENCTL_SECRETPROMPT_H
#define XENCTL_SECRETPROMPT_H

#include "../xenctl_global.h"
#include <QtCore/QString>

namespace XenCtl
{
    /**
     * @brief Source of secrets (passwords) that were not given programmatically
     */
    class XENCTL_EXPORT SecretPrompt
    {
        public:
            virtual ~SecretPrompt() {}

            /**
             * @brief Ask for a secret
             * @param prompt Text shown to the user
             * @return The secret; a null string when none could be read
             */
            virtual QString ReadSecret(const QString& prompt) = 0;
    };

    /**
     * @brief Reads one line from stdin with terminal echo switched off
     *
     * The prompt goes to stderr so that stdout stays clean for command output.
     */
    class XENCTL_EXPORT TerminalSecretPrompt : public SecretPrompt
    {
        public:
            QString ReadSecret(const QString& prompt) override;
    };
}

#endif // XENCTL_SECRETPROMPT_H
