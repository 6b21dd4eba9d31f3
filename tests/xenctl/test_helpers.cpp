/*
 * Copyright (c) 2025, Petr Bena <petr@bena.rocks>
 * All rights reserved.
 */

#include "test_helpers.h"
#include "xenctl/xen/session.h"

using namespace XenCtl;

QSharedPointer<Session> OpenFakeSession(const QSharedPointer<FakeXenServer>& server, const QString& endpoint)
{
    return Session::Open(endpoint, "root", "secret", nullptr, server);
}

QVariantMap MakeVmRecord(const QString& name, const QString& uuid, const QString& powerState,
                         bool isTemplate, const QStringList& vbds)
{
    QVariantMap record;
    record.insert("name_label", name);
    record.insert("uuid", uuid);
    record.insert("power_state", powerState);
    record.insert("is_a_template", isTemplate);
    record.insert("VBDs", vbds);
    return record;
}
