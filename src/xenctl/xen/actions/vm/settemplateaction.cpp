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

#include "settemplateaction.h"
#include "../../session.h"
#include "../../vmhelpers.h"
#include "../../xenapi/xenapi_VM.h"
#include <stdexcept>

namespace XenCtl
{
    SetTemplateAction::SetTemplateAction(Session* session, const QString& vm, bool isTemplate, QObject* parent)
        : Operation(session, isTemplate ? "Convert to template" : "Convert to VM", QString("Updating '%1'").arg(vm), parent)
        , m_vm(vm)
        , m_isTemplate(isTemplate)
    {
        if (vm.isEmpty())
            throw std::invalid_argument("No VM name given");
    }

    void SetTemplateAction::run()
    {
        const QString vmRef = VMHelpers::FindVm(this->session(), this->m_vm);
        API::VM::set_is_a_template(this->session(), vmRef, this->m_isTemplate);
        this->setResult(vmRef);
    }
}
