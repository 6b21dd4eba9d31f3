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

#include "xmlrpcclient.h"
#include "failure.h"
#include <QtCore/QDebug>
#include <QtCore/QXmlStreamReader>
#include <QtCore/QXmlStreamWriter>

namespace XenCtl
{
    QByteArray XmlRpcClient::BuildMethodCall(const QString& method, const RpcValueList& params)
    {
        QByteArray xml;
        QXmlStreamWriter writer(&xml);
        writer.setAutoFormatting(false);

        writer.writeStartDocument();
        writer.writeStartElement("methodCall");
        writer.writeTextElement("methodName", method);
        writer.writeStartElement("params");
        for (const RpcValue& param : params)
        {
            writer.writeStartElement("param");
            WriteValue(writer, param);
            writer.writeEndElement();
        }
        writer.writeEndElement(); // params
        writer.writeEndElement(); // methodCall
        writer.writeEndDocument();

        return xml;
    }

    QByteArray XmlRpcClient::BuildMethodResponse(const RpcValue& value)
    {
        QByteArray xml;
        QXmlStreamWriter writer(&xml);

        writer.writeStartDocument();
        writer.writeStartElement("methodResponse");
        writer.writeStartElement("params");
        writer.writeStartElement("param");
        WriteValue(writer, value);
        writer.writeEndElement();
        writer.writeEndElement();
        writer.writeEndElement();
        writer.writeEndDocument();

        return xml;
    }

    QByteArray XmlRpcClient::BuildFaultResponse(int faultCode, const QString& faultString)
    {
        QByteArray xml;
        QXmlStreamWriter writer(&xml);

        writer.writeStartDocument();
        writer.writeStartElement("methodResponse");
        writer.writeStartElement("fault");
        WriteValue(writer, RpcValue::Fault(faultCode, faultString));
        writer.writeEndElement();
        writer.writeEndElement();
        writer.writeEndDocument();

        return xml;
    }

    void XmlRpcClient::WriteValue(QXmlStreamWriter& writer, const RpcValue& value)
    {
        writer.writeStartElement("value");

        switch (value.type())
        {
            case RpcValue::Type::Nil:
                writer.writeEmptyElement("nil");
                break;
            case RpcValue::Type::Boolean:
                writer.writeTextElement("boolean", value.scalar().toBool() ? "1" : "0");
                break;
            case RpcValue::Type::String:
                writer.writeTextElement("string", value.scalar().toString());
                break;
            case RpcValue::Type::Int:
            case RpcValue::Type::I4:
                writer.writeTextElement(value.typeName(), QString::number(value.scalar().toInt()));
                break;
            case RpcValue::Type::I8:
                writer.writeTextElement("i8", QString::number(value.scalar().toLongLong()));
                break;
            case RpcValue::Type::Double:
                writer.writeTextElement("double", QString::number(value.scalar().toDouble(), 'g', 17));
                break;
            case RpcValue::Type::DateTime:
                writer.writeTextElement("dateTime.iso8601", RpcValue::FormatDateTime(value.scalar().toDateTime()));
                break;
            case RpcValue::Type::Base64:
                writer.writeTextElement("base64", QString::fromLatin1(value.scalar().toByteArray().toBase64()));
                break;
            case RpcValue::Type::Array:
                writer.writeStartElement("array");
                writer.writeStartElement("data");
                for (const RpcValue& item : value.items())
                    WriteValue(writer, item);
                writer.writeEndElement();
                writer.writeEndElement();
                break;
            case RpcValue::Type::Struct:
            case RpcValue::Type::Fault:
            {
                writer.writeStartElement("struct");
                const QMap<QString, RpcValue>& members = value.members();
                for (auto it = members.constBegin(); it != members.constEnd(); ++it)
                {
                    writer.writeStartElement("member");
                    writer.writeTextElement("name", it.key());
                    WriteValue(writer, it.value());
                    writer.writeEndElement();
                }
                writer.writeEndElement();
                break;
            }
        }

        writer.writeEndElement(); // value
    }

    void XmlRpcClient::expectStartElement(QXmlStreamReader& reader, const char* name)
    {
        if (!reader.readNextStartElement() || reader.name() != QLatin1String(name))
        {
            throw TransportError(QString("Malformed XML-RPC message: expected <%1>, got <%2> %3")
                                     .arg(QLatin1String(name), reader.name().toString(), reader.errorString()));
        }
    }

    RpcValue XmlRpcClient::ReadValue(QXmlStreamReader& reader)
    {
        RpcValue result;
        bool typed = false;
        QString text;

        while (!reader.atEnd())
        {
            reader.readNext();
            if (reader.isCharacters())
            {
                text += reader.text().toString();
            } else if (reader.isStartElement())
            {
                result = readTypedValue(reader);
                typed = true;
            } else if (reader.isEndElement())
            {
                break;
            }
        }

        if (reader.hasError())
            throw TransportError(QString("Malformed XML-RPC value: %1").arg(reader.errorString()));

        if (!typed)
            result = RpcValue::String(text);
        return result;
    }

    RpcValue XmlRpcClient::readTypedValue(QXmlStreamReader& reader)
    {
        const QString tag = reader.name().toString();
        bool ok = true;

        if (tag == "string")
            return RpcValue::String(reader.readElementText());

        if (tag == "boolean")
        {
            const QString text = reader.readElementText().trimmed();
            if (text != "0" && text != "1" && text != "true" && text != "false")
                throw TransportError(QString("Malformed XML-RPC boolean: %1").arg(text));
            return RpcValue::Boolean(text == "1" || text == "true");
        }

        if (tag == "int" || tag == "i4")
        {
            const int number = reader.readElementText().trimmed().toInt(&ok);
            if (!ok)
                throw TransportError(QString("Malformed XML-RPC %1").arg(tag));
            return tag == "int" ? RpcValue::Int(number) : RpcValue::I4(number);
        }

        if (tag == "i8")
        {
            const qint64 number = reader.readElementText().trimmed().toLongLong(&ok);
            if (!ok)
                throw TransportError("Malformed XML-RPC i8");
            return RpcValue::I8(number);
        }

        if (tag == "double")
        {
            const double number = reader.readElementText().trimmed().toDouble(&ok);
            if (!ok)
                throw TransportError("Malformed XML-RPC double");
            return RpcValue::Double(number);
        }

        if (tag == "dateTime.iso8601")
        {
            const QString text = reader.readElementText();
            const QDateTime parsed = RpcValue::ParseDateTime(text);
            if (!parsed.isValid())
                throw TransportError(QString("Malformed XML-RPC dateTime: %1").arg(text));
            return RpcValue::DateTime(parsed);
        }

        if (tag == "base64")
            return RpcValue::Base64(QByteArray::fromBase64(reader.readElementText().toLatin1()));

        if (tag == "nil")
        {
            reader.skipCurrentElement();
            return RpcValue::Nil();
        }

        if (tag == "array")
        {
            RpcValueList items;
            expectStartElement(reader, "data");
            while (reader.readNextStartElement())
            {
                if (reader.name() != QLatin1String("value"))
                    throw TransportError("Malformed XML-RPC array: expected <value>");
                items.append(ReadValue(reader));
            }
            reader.skipCurrentElement(); // </array>
            return RpcValue::Array(items);
        }

        if (tag == "struct")
        {
            QMap<QString, RpcValue> members;
            while (reader.readNextStartElement())
            {
                if (reader.name() != QLatin1String("member"))
                    throw TransportError("Malformed XML-RPC struct: expected <member>");
                expectStartElement(reader, "name");
                const QString name = reader.readElementText();
                expectStartElement(reader, "value");
                members.insert(name, ReadValue(reader));
                reader.skipCurrentElement(); // </member>
            }
            return RpcValue::Struct(members);
        }

        throw TransportError(QString("Unsupported XML-RPC type <%1>").arg(tag));
    }

    QVariant XmlRpcClient::ParseMethodResponse(const QByteArray& body, const QString& method)
    {
        QXmlStreamReader reader(body);

        expectStartElement(reader, "methodResponse");
        if (!reader.readNextStartElement())
            throw TransportError("Malformed XML-RPC response: empty <methodResponse>");

        if (reader.name() == QLatin1String("fault"))
        {
            expectStartElement(reader, "value");
            const QVariantMap fault = ReadValue(reader).toVariant().toMap();
            const QStringList description = QStringList()
                << fault.value("faultCode").toString()
                << fault.value("faultString").toString();
            qWarning() << "XmlRpcClient: fault" << description << "calling" << method;
            throw RemoteError(method, "Fault", description);
        }

        if (reader.name() != QLatin1String("params"))
            throw TransportError(QString("Malformed XML-RPC response: unexpected <%1>").arg(reader.name().toString()));

        // A response without <param> is a void result
        if (!reader.readNextStartElement())
            return QVariant();
        if (reader.name() != QLatin1String("param"))
            throw TransportError("Malformed XML-RPC response: expected <param>");

        expectStartElement(reader, "value");
        return ReadValue(reader).toVariant();
    }

    RpcValueList XmlRpcClient::ParseMethodCall(const QByteArray& body, QString* method)
    {
        QXmlStreamReader reader(body);
        RpcValueList params;

        expectStartElement(reader, "methodCall");
        expectStartElement(reader, "methodName");
        const QString name = reader.readElementText().trimmed();
        if (method)
            *method = name;

        if (!reader.readNextStartElement())
            return params;
        if (reader.name() != QLatin1String("params"))
            throw TransportError("Malformed XML-RPC call: expected <params>");

        while (reader.readNextStartElement())
        {
            if (reader.name() != QLatin1String("param"))
                throw TransportError("Malformed XML-RPC call: expected <param>");
            expectStartElement(reader, "value");
            params.append(ReadValue(reader));
            reader.skipCurrentElement(); // </param>
        }

        return params;
    }
}
