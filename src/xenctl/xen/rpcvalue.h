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

#ifndef XENCTL_RPCVALUE_H
#define XENCTL_RPCVALUE_H

#include "../xenctl_global.h"
#include <QtCore/QByteArray>
#include <QtCore/QDateTime>
#include <QtCore/QList>
#include <QtCore/QMap>
#include <QtCore/QString>
#include <QtCore/QVariant>

namespace XenCtl
{
    /**
     * @brief Explicitly typed XML-RPC value
     *
     * Every argument sent to the server carries one of the XML-RPC wire
     * types. Nothing is guessed on the way out: a QString is always sent as
     * <string>, even when it looks like a number, so the server never
     * reinterprets it. Numbers, booleans and dates have to be tagged through
     * the named factories.
     *
     * Shortcuts mirror the XML-RPC type names:
     * @code
     * RpcValue::Boolean(true), RpcValue::String("42"), RpcValue::Int(4),
     * RpcValue::I8(17179869184), RpcValue::Double(0.5), RpcValue::Nil(),
     * RpcValue::Array({...}), RpcValue::Struct({{"key", "value"}})
     * @endcode
     */
    class XENCTL_EXPORT RpcValue
    {
        public:
            enum class Type
            {
                Nil,
                Boolean,
                String,
                Int,
                I4,
                I8,
                Double,
                DateTime,
                Base64,
                Array,
                Struct,
                Fault
            };

            // Nil
            RpcValue();
            // Forced string encoding
            RpcValue(const QString& value);
            RpcValue(const char* value);

            static RpcValue Nil();
            static RpcValue Boolean(bool value);
            static RpcValue String(const QString& value);
            static RpcValue Int(int value);
            static RpcValue I4(qint32 value);
            static RpcValue I8(qint64 value);
            static RpcValue Double(double value);
            static RpcValue DateTime(const QDateTime& value);
            static RpcValue Base64(const QByteArray& value);
            static RpcValue Array(const QList<RpcValue>& items);
            static RpcValue Struct(const QMap<QString, RpcValue>& members);
            static RpcValue Fault(int faultCode, const QString& faultString);

            /**
             * @brief Convert a decoded QVariant tree back into wire values
             *
             * Only meant for re-sending data that came from the server
             * (records, maps). Strings stay strings, lists become arrays,
             * maps become structs, qint64 becomes i8.
             */
            static RpcValue FromVariant(const QVariant& value);

            Type type() const { return this->m_type; }
            QString typeName() const;
            bool isNil() const { return this->m_type == Type::Nil; }

            // Scalar payload (bool, QString, int, qint64, double, QDateTime, QByteArray)
            const QVariant& scalar() const { return this->m_scalar; }
            const QList<RpcValue>& items() const { return this->m_items; }
            const QMap<QString, RpcValue>& members() const { return this->m_members; }

            // Same conversion the decoder applies to server values
            QVariant toVariant() const;

            bool operator==(const RpcValue& other) const;
            bool operator!=(const RpcValue& other) const { return !(*this == other); }

            // XML-RPC dateTime.iso8601 as produced by XenServer: yyyyMMddTHH:mm:ssZ
            static QString FormatDateTime(const QDateTime& value);
            static QDateTime ParseDateTime(const QString& value);

        private:
            RpcValue(Type type, const QVariant& scalar);

            Type m_type;
            QVariant m_scalar;
            QList<RpcValue> m_items;
            QMap<QString, RpcValue> m_members;
    };

    typedef QList<RpcValue> RpcValueList;
}

#endif // XENCTL_RPCVALUE_H
