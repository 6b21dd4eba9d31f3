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

#include "rpcvalue.h"
#include <QtCore/QStringList>

namespace XenCtl
{
    RpcValue::RpcValue() : m_type(Type::Nil)
    {
    }

    RpcValue::RpcValue(const QString& value) : m_type(Type::String), m_scalar(value)
    {
    }

    RpcValue::RpcValue(const char* value) : m_type(Type::String), m_scalar(QString::fromUtf8(value))
    {
    }

    RpcValue::RpcValue(Type type, const QVariant& scalar) : m_type(type), m_scalar(scalar)
    {
    }

    RpcValue RpcValue::Nil()
    {
        return RpcValue();
    }

    RpcValue RpcValue::Boolean(bool value)
    {
        return RpcValue(Type::Boolean, value);
    }

    RpcValue RpcValue::String(const QString& value)
    {
        return RpcValue(Type::String, value);
    }

    RpcValue RpcValue::Int(int value)
    {
        return RpcValue(Type::Int, value);
    }

    RpcValue RpcValue::I4(qint32 value)
    {
        return RpcValue(Type::I4, value);
    }

    RpcValue RpcValue::I8(qint64 value)
    {
        return RpcValue(Type::I8, value);
    }

    RpcValue RpcValue::Double(double value)
    {
        return RpcValue(Type::Double, value);
    }

    RpcValue RpcValue::DateTime(const QDateTime& value)
    {
        return RpcValue(Type::DateTime, value.toUTC());
    }

    RpcValue RpcValue::Base64(const QByteArray& value)
    {
        return RpcValue(Type::Base64, value);
    }

    RpcValue RpcValue::Array(const QList<RpcValue>& items)
    {
        RpcValue value(Type::Array, QVariant());
        value.m_items = items;
        return value;
    }

    RpcValue RpcValue::Struct(const QMap<QString, RpcValue>& members)
    {
        RpcValue value(Type::Struct, QVariant());
        value.m_members = members;
        return value;
    }

    RpcValue RpcValue::Fault(int faultCode, const QString& faultString)
    {
        RpcValue value(Type::Fault, QVariant());
        value.m_members.insert("faultCode", RpcValue::Int(faultCode));
        value.m_members.insert("faultString", RpcValue::String(faultString));
        return value;
    }

    RpcValue RpcValue::FromVariant(const QVariant& value)
    {
        if (!value.isValid())
            return RpcValue::Nil();

        switch (value.userType())
        {
            case QMetaType::Bool:
                return RpcValue::Boolean(value.toBool());
            case QMetaType::Int:
            case QMetaType::Short:
            case QMetaType::UShort:
                return RpcValue::Int(value.toInt());
            case QMetaType::UInt:
            case QMetaType::LongLong:
            case QMetaType::ULongLong:
            case QMetaType::Long:
            case QMetaType::ULong:
                return RpcValue::I8(value.toLongLong());
            case QMetaType::Double:
            case QMetaType::Float:
                return RpcValue::Double(value.toDouble());
            case QMetaType::QDateTime:
                return RpcValue::DateTime(value.toDateTime());
            case QMetaType::QByteArray:
                return RpcValue::Base64(value.toByteArray());
            case QMetaType::QStringList:
            {
                QList<RpcValue> items;
                for (const QString& s : value.toStringList())
                    items.append(RpcValue::String(s));
                return RpcValue::Array(items);
            }
            case QMetaType::QVariantList:
            {
                QList<RpcValue> items;
                for (const QVariant& item : value.toList())
                    items.append(RpcValue::FromVariant(item));
                return RpcValue::Array(items);
            }
            case QMetaType::QVariantMap:
            {
                QMap<QString, RpcValue> members;
                const QVariantMap map = value.toMap();
                for (auto it = map.constBegin(); it != map.constEnd(); ++it)
                    members.insert(it.key(), RpcValue::FromVariant(it.value()));
                return RpcValue::Struct(members);
            }
            default:
                return RpcValue::String(value.toString());
        }
    }

    QString RpcValue::typeName() const
    {
        switch (this->m_type)
        {
            case Type::Nil:
                return "nil";
            case Type::Boolean:
                return "boolean";
            case Type::String:
                return "string";
            case Type::Int:
                return "int";
            case Type::I4:
                return "i4";
            case Type::I8:
                return "i8";
            case Type::Double:
                return "double";
            case Type::DateTime:
                return "dateTime.iso8601";
            case Type::Base64:
                return "base64";
            case Type::Array:
                return "array";
            case Type::Struct:
                return "struct";
            case Type::Fault:
                return "fault";
        }
        return QString();
    }

    QVariant RpcValue::toVariant() const
    {
        switch (this->m_type)
        {
            case Type::Nil:
                return QVariant();
            case Type::Array:
            {
                QVariantList list;
                for (const RpcValue& item : this->m_items)
                    list.append(item.toVariant());
                return list;
            }
            case Type::Struct:
            case Type::Fault:
            {
                QVariantMap map;
                for (auto it = this->m_members.constBegin(); it != this->m_members.constEnd(); ++it)
                    map.insert(it.key(), it.value().toVariant());
                return map;
            }
            default:
                return this->m_scalar;
        }
    }

    bool RpcValue::operator==(const RpcValue& other) const
    {
        return this->m_type == other.m_type
            && this->m_scalar == other.m_scalar
            && this->m_items == other.m_items
            && this->m_members == other.m_members;
    }

    QString RpcValue::FormatDateTime(const QDateTime& value)
    {
        return value.toUTC().toString("yyyyMMdd'T'HH:mm:ss'Z'");
    }

    QDateTime RpcValue::ParseDateTime(const QString& value)
    {
        static const QStringList formats = {
            "yyyyMMdd'T'HH:mm:ss'Z'",
            "yyyyMMdd'T'HH:mm:ss",
            "yyyy-MM-dd'T'HH:mm:ss'Z'",
            "yyyy-MM-dd'T'HH:mm:ss"
        };

        const QString trimmed = value.trimmed();
        for (const QString& format : formats)
        {
            QDateTime parsed = QDateTime::fromString(trimmed, format);
            if (parsed.isValid())
            {
                parsed.setTimeSpec(Qt::UTC);
                return parsed;
            }
        }

        QDateTime iso = QDateTime::fromString(trimmed, Qt::ISODate);
        return iso.isValid() ? iso.toUTC() : QDateTime();
    }
}
