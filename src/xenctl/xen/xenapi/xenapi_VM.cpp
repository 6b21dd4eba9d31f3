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

#include "xenapi_VM.h"
#include "xenapi_Helper.h"
#include "../session.h"

namespace XenCtl
{
    namespace API
    {
        QVariantMap VM::get_all_records(Session* session)
        {
            return session->Call("VM.get_all_records").toMap();
        }

        QVariantMap VM::get_record(Session* session, const QString& vm)
        {
            return session->Call("VM.get_record", RpcValueList() << vm).toMap();
        }

        QString VM::clone(Session* session, const QString& vm, const QString& newName)
        {
            return session->Call("VM.clone", RpcValueList() << vm << newName).toString();
        }

        void VM::provision(Session* session, const QString& vm)
        {
            session->Call("VM.provision", RpcValueList() << vm);
        }

        void VM::start(Session* session, const QString& vm, bool start_paused, bool force)
        {
            session->Call("VM.start", RpcValueList() << vm << RpcValue::Boolean(start_paused)
                                                      << RpcValue::Boolean(force));
        }

        void VM::hard_shutdown(Session* session, const QString& vm)
        {
            session->Call("VM.hard_shutdown", RpcValueList() << vm);
        }

        void VM::destroy(Session* session, const QString& vm)
        {
            session->Call("VM.destroy", RpcValueList() << vm);
        }

        void VM::set_VCPUs_max(Session* session, const QString& vm, qint64 value)
        {
            session->Call("VM.set_VCPUs_max", RpcValueList() << vm << Helper::Int64(value));
        }

        void VM::set_VCPUs_at_startup(Session* session, const QString& vm, qint64 value)
        {
            session->Call("VM.set_VCPUs_at_startup", RpcValueList() << vm << Helper::Int64(value));
        }

        void VM::set_memory_limits(Session* session, const QString& vm,
                                   qint64 static_min, qint64 static_max,
                                   qint64 dynamic_min, qint64 dynamic_max)
        {
            session->Call("VM.set_memory_limits", RpcValueList() << vm
                                                                  << Helper::Int64(static_min)
                                                                  << Helper::Int64(static_max)
                                                                  << Helper::Int64(dynamic_min)
                                                                  << Helper::Int64(dynamic_max));
        }

        void VM::set_memory_dynamic_min(Session* session, const QString& vm, qint64 value)
        {
            session->Call("VM.set_memory_dynamic_min", RpcValueList() << vm << Helper::Int64(value));
        }

        void VM::set_memory_dynamic_max(Session* session, const QString& vm, qint64 value)
        {
            session->Call("VM.set_memory_dynamic_max", RpcValueList() << vm << Helper::Int64(value));
        }

        void VM::set_memory_static_min(Session* session, const QString& vm, qint64 value)
        {
            session->Call("VM.set_memory_static_min", RpcValueList() << vm << Helper::Int64(value));
        }

        void VM::set_memory_static_max(Session* session, const QString& vm, qint64 value)
        {
            session->Call("VM.set_memory_static_max", RpcValueList() << vm << Helper::Int64(value));
        }

        void VM::set_is_a_template(Session* session, const QString& vm, bool value)
        {
            session->Call("VM.set_is_a_template", RpcValueList() << vm << RpcValue::Boolean(value));
        }

        QString VM::get_guest_metrics(Session* session, const QString& vm)
        {
            return session->Call("VM.get_guest_metrics", RpcValueList() << vm).toString();
        }

        QVariantMap VM_guest_metrics::get_networks(Session* session, const QString& metrics)
        {
            return session->Call("VM_guest_metrics.get_networks", RpcValueList() << metrics).toMap();
        }
    }
}
