/*
 * Copyright (c) 2025, Petr Bena <petr@bena.rocks>
 * All rights reserved.
 */

#include "fakexenserver.h"
#include "xenctl/xen/xmlrpcclient.h"

using namespace XenCtl;

FakeReply FakeReply::Ok(const RpcValue& value)
{
    FakeReply reply;
    reply.value = value;
    return reply;
}

FakeReply FakeReply::Ok(const QVariant& value)
{
    return Ok(RpcValue::FromVariant(value));
}

FakeReply FakeReply::Fail(const QStringList& errorDescription, const QString& status)
{
    FakeReply reply;
    reply.status = status;
    reply.errorDescription = errorDescription;
    return reply;
}

QString RecordedCall::Arg(int index) const
{
    if (index < 0 || index >= this->params.size())
        return QString();
    return this->params.at(index).toVariant().toString();
}

FakeXenServer::FakeXenServer(const QString& name, const QString& password)
    : m_name(name), m_password(password)
{
    this->m_advertised << "session.login_with_password" << "session.logout"
                       << "task.create" << "task.get_record" << "task.destroy" << "task.cancel"
                       << "VM.get_all_records" << "VM.get_record" << "VM.clone" << "VM.provision"
                       << "VM.start" << "VM.hard_shutdown" << "VM.destroy"
                       << "VM.set_VCPUs_max" << "VM.set_VCPUs_at_startup"
                       << "VM.set_memory_limits" << "VM.set_memory_dynamic_min" << "VM.set_memory_dynamic_max"
                       << "VM.set_memory_static_min" << "VM.set_memory_static_max"
                       << "VM.set_is_a_template" << "VM.get_guest_metrics"
                       << "VM_guest_metrics.get_networks"
                       << "VBD.get_record" << "VDI.destroy" << "SR.get_all_records"
                       << "host.get_all_records" << "host_metrics.get_record" << "host_cpu.get_all_records";
    this->m_taskStatuses << "success";
}

void FakeXenServer::On(const QString& method, Handler handler)
{
    this->m_handlers.insert(method, handler);
    if (!this->m_advertised.contains(method))
        this->m_advertised.append(method);
}

void FakeXenServer::Advertise(const QStringList& methods)
{
    for (const QString& method : methods)
    {
        if (!this->m_advertised.contains(method))
            this->m_advertised.append(method);
    }
}

void FakeXenServer::SetRecords(const QString& method, const QVariantMap& records)
{
    this->On(method, [records](const RpcValueList&) { return FakeReply::Ok(QVariant(records)); });
}

void FakeXenServer::SetTaskStatuses(const QStringList& statuses)
{
    this->m_taskStatuses = statuses;
}

void FakeXenServer::SetTaskResult(const QString& result)
{
    this->m_taskResult = result;
}

void FakeXenServer::SetTaskErrorInfo(const QStringList& errorInfo)
{
    this->m_taskErrorInfo = errorInfo;
}

QByteArray FakeXenServer::Post(const QByteArray& body)
{
    QString method;
    const RpcValueList params = XmlRpcClient::ParseMethodCall(body, &method);

    {
        QMutexLocker locker(&this->m_lock);
        RecordedCall call;
        call.method = method;
        call.params = params;
        this->m_calls.append(call);
    }

    // Not wrapped in a status envelope
    if (method == "system.listMethods")
    {
        QList<RpcValue> names;
        for (const QString& name : this->m_advertised)
            names.append(RpcValue::String(name));
        return XmlRpcClient::BuildMethodResponse(RpcValue::Array(names));
    }

    return envelope(this->dispatch(method, params));
}

FakeReply FakeXenServer::dispatch(const QString& method, const RpcValueList& params)
{
    if (this->m_handlers.contains(method))
        return this->m_handlers.value(method)(params);

    const QString session = params.isEmpty() ? QString() : params.first().toVariant().toString();

    if (method == "session.login_with_password")
    {
        if (params.size() != 2)
            return FakeReply::Fail(QStringList() << "MESSAGE_PARAMETER_COUNT_MISMATCH" << method);
        const QString user = params.at(0).toVariant().toString();
        if (params.at(1).toVariant().toString() != this->m_password)
            return FakeReply::Fail(QStringList() << "SESSION_AUTHENTICATION_FAILED" << user << "Authentication failure");
        return FakeReply::Ok(RpcValue::String(this->SessionId()));
    }

    if (session != this->SessionId())
        return FakeReply::Fail(QStringList() << "SESSION_INVALID" << session);

    if (method == "task.create")
    {
        const QString ref = QString("OpaqueRef:task-%1-%2").arg(this->m_name).arg(this->m_createdTasks.size() + 1);
        FakeTask task;
        task.label = params.value(1).toVariant().toString();
        this->m_tasks.insert(ref, task);
        this->m_createdTasks.append(ref);
        return FakeReply::Ok(RpcValue::String(ref));
    }

    if (method == "task.get_record")
        return this->taskRecord(params.value(1).toVariant().toString());

    if (method == "task.destroy")
    {
        const QString ref = params.value(1).toVariant().toString();
        if (!this->m_tasks.contains(ref))
            return FakeReply::Fail(QStringList() << "HANDLE_INVALID" << "task" << ref);
        this->m_tasks.remove(ref);
        this->m_destroyedTasks.append(ref);
        return FakeReply::Ok();
    }

    if (this->m_advertised.contains(method))
        return FakeReply::Ok();

    return FakeReply::Fail(QStringList() << "MESSAGE_METHOD_UNKNOWN" << method);
}

FakeReply FakeXenServer::taskRecord(const QString& taskRef)
{
    if (!this->m_tasks.contains(taskRef))
        return FakeReply::Fail(QStringList() << "HANDLE_INVALID" << "task" << taskRef);

    FakeTask& task = this->m_tasks[taskRef];
    const QString status = this->m_taskStatuses.value(qMin(task.polls, this->m_taskStatuses.size() - 1));
    ++task.polls;

    QVariantMap record;
    record.insert("uuid", taskRef.mid(10));
    record.insert("name_label", task.label);
    record.insert("status", status);
    record.insert("progress", status == "pending" ? 0.5 : 1.0);
    record.insert("result", status == "success" ? this->m_taskResult : QString());
    record.insert("error_info", status == "failure" ? this->m_taskErrorInfo : QStringList());
    return FakeReply::Ok(QVariant(record));
}

QByteArray FakeXenServer::envelope(const FakeReply& reply)
{
    QMap<QString, RpcValue> members;
    members.insert("Status", RpcValue::String(reply.status));
    if (reply.status == "Success")
    {
        members.insert("Value", reply.value);
    } else
    {
        QList<RpcValue> description;
        for (const QString& item : reply.errorDescription)
            description.append(RpcValue::String(item));
        members.insert("ErrorDescription", RpcValue::Array(description));
    }
    return XmlRpcClient::BuildMethodResponse(RpcValue::Struct(members));
}

QList<RecordedCall> FakeXenServer::Calls() const
{
    QMutexLocker locker(&this->m_lock);
    return this->m_calls;
}

QList<RecordedCall> FakeXenServer::CallsTo(const QString& method) const
{
    QList<RecordedCall> result;
    for (const RecordedCall& call : this->Calls())
    {
        if (call.method == method)
            result.append(call);
    }
    return result;
}

int FakeXenServer::CountCalls(const QString& method) const
{
    return this->CallsTo(method).size();
}

QStringList FakeXenServer::CalledMethods() const
{
    QStringList result;
    for (const RecordedCall& call : this->Calls())
        result.append(call.method);
    return result;
}

QStringList FakeXenServer::CreatedTasks() const
{
    return this->m_createdTasks;
}

QStringList FakeXenServer::DestroyedTasks() const
{
    return this->m_destroyedTasks;
}
