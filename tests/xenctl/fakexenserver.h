/*
 * Copyright (c) 2025, Petr Bena <petr@bena.rocks>
 * All rights reserved.
 */

#ifndef XENCTL_TESTS_FAKEXENSERVER_H
#define XENCTL_TESTS_FAKEXENSERVER_H

#include <QMap>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <functional>
#include "xenctl/xen/network/rpctransport.h"
#include "xenctl/xen/rpcvalue.h"

struct FakeReply
{
    QString status = "Success";
    XenCtl::RpcValue value;
    QStringList errorDescription;

    static FakeReply Ok(const XenCtl::RpcValue& value = XenCtl::RpcValue::String(QString()));
    static FakeReply Ok(const QVariant& value);
    static FakeReply Fail(const QStringList& errorDescription, const QString& status = "Failure");
};

struct RecordedCall
{
    QString method;
    XenCtl::RpcValueList params;

    // Parameter as string, the session token being parameter 0 of gated calls
    QString Arg(int index) const;
};

/**
 * @brief In-process xapi answering XML-RPC requests from scripted handlers
 *
 * Advertised methods without a handler succeed with an empty string. The
 * task class is built in: every created task walks through the statuses
 * given to SetTaskStatuses, one per get_record, repeating the last one.
 */
class FakeXenServer : public XenCtl::RpcTransport
{
    public:
        using Handler = std::function<FakeReply(const XenCtl::RpcValueList& params)>;

        explicit FakeXenServer(const QString& name = "xen1", const QString& password = "secret");

        QByteArray Post(const QByteArray& body) override;

        void On(const QString& method, Handler handler);
        void Advertise(const QStringList& methods);

        // Canned get_all_records answer for VM, SR, host...
        void SetRecords(const QString& method, const QVariantMap& records);

        void SetTaskStatuses(const QStringList& statuses);
        void SetTaskResult(const QString& result);
        void SetTaskErrorInfo(const QStringList& errorInfo);

        QString SessionId() const { return "OpaqueRef:session-" + this->m_name; }

        QList<RecordedCall> Calls() const;
        QList<RecordedCall> CallsTo(const QString& method) const;
        int CountCalls(const QString& method) const;
        QStringList CalledMethods() const;

        QStringList CreatedTasks() const;
        QStringList DestroyedTasks() const;

    private:
        struct FakeTask
        {
            QString label;
            int polls = 0;
        };

        FakeReply dispatch(const QString& method, const XenCtl::RpcValueList& params);
        FakeReply taskRecord(const QString& taskRef);
        static QByteArray envelope(const FakeReply& reply);

        QString m_name;
        QString m_password;
        QStringList m_advertised;
        QMap<QString, Handler> m_handlers;

        QStringList m_taskStatuses;
        QString m_taskResult;
        QStringList m_taskErrorInfo;
        QMap<QString, FakeTask> m_tasks;
        QStringList m_createdTasks;
        QStringList m_destroyedTasks;

        mutable QMutex m_lock;
        QList<RecordedCall> m_calls;
};

#endif // XENCTL_TESTS_FAKEXENSERVER_H
