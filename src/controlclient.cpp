/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "controlclient.h"

#include <QDomDocument>
#include <QDomElement>
#include <QXmlStreamWriter>

#include "errors.hpp"
#include "logger.hpp"

static const auto soapEnvelopeNs =
    QStringLiteral("http://schemas.xmlsoap.org/soap/envelope/");
static const auto soapEncodingNs =
    QStringLiteral("http://schemas.xmlsoap.org/soap/encoding/");

void ControlResult::add(QString name, QString value) {
    m_fields.emplace_back(std::move(name), std::move(value));
}

std::optional<QString> ControlResult::value(const QString &name) const {
    for (const auto &[key, value] : m_fields) {
        if (key == name) return value;
    }
    return std::nullopt;
}

ControlClient::ControlClient(int timeout) : m_timeout{timeout} {}

QByteArray ControlClient::soapAction(const QString &serviceType,
                                     const QString &action) {
    return QStringLiteral("\"%1#%2\"").arg(serviceType, action).toUtf8();
}

QByteArray ControlClient::makeEnvelope(const QString &serviceType,
                                       const ControlCommand &command) {
    QByteArray data;
    QXmlStreamWriter writer{&data};

    writer.writeStartDocument();
    writer.writeNamespace(soapEnvelopeNs, QStringLiteral("s"));
    writer.writeStartElement(soapEnvelopeNs, QStringLiteral("Envelope"));
    writer.writeAttribute(soapEnvelopeNs, QStringLiteral("encodingStyle"),
                          soapEncodingNs);
    writer.writeStartElement(soapEnvelopeNs, QStringLiteral("Body"));

    writer.writeNamespace(serviceType, QStringLiteral("u"));
    writer.writeStartElement(serviceType, command.action);
    for (const auto &[name, value] : command.args)
        writer.writeTextElement(name, value);
    writer.writeEndElement();

    writer.writeEndElement();  // Body
    writer.writeEndElement();  // Envelope
    writer.writeEndDocument();

    return data;
}

static QDomElement findChild(const QDomElement &parent, const QString &name) {
    for (auto e = parent.firstChildElement(); !e.isNull();
         e = e.nextSiblingElement()) {
        const auto local = e.localName().isEmpty() ? e.tagName() : e.localName();
        if (local == name) return e;
    }
    return {};
}

static QDomElement findDescendant(const QDomElement &parent,
                                  const QString &name) {
    for (auto e = parent.firstChildElement(); !e.isNull();
         e = e.nextSiblingElement()) {
        const auto local = e.localName().isEmpty() ? e.tagName() : e.localName();
        if (local == name) return e;
        if (auto found = findDescendant(e, name); !found.isNull()) return found;
    }
    return {};
}

[[noreturn]] static void throwFault(const QDomElement &fault) {
    const auto upnpError = findDescendant(fault, QStringLiteral("UPnPError"));
    if (upnpError.isNull()) {
        const auto faultString =
            findChild(fault, QStringLiteral("faultstring")).text().trimmed();
        throw ControlFault{-1, faultString};
    }

    bool ok = false;
    const auto code =
        findChild(upnpError, QStringLiteral("errorCode")).text().trimmed().toInt(
            &ok);
    const auto description =
        findChild(upnpError, QStringLiteral("errorDescription"))
            .text()
            .trimmed();

    throw ControlFault{ok ? code : -1, description};
}

ControlResult ControlClient::decodeResponse(int status, const QByteArray &body,
                                            const QString &action) {
    const bool httpOk = status >= 200 && status < 300;

    QDomDocument doc;
    QString error;
    if (body.isEmpty() || !doc.setContent(body, true, &error)) {
        throw TransportError{"invalid control response (status " +
                             std::to_string(status) + "): " +
                             error.toStdString()};
    }

    const auto soapBody =
        findChild(doc.documentElement(), QStringLiteral("Body"));
    if (soapBody.isNull())
        throw TransportError{"control response has no soap body"};

    if (auto fault = findChild(soapBody, QStringLiteral("Fault"));
        !fault.isNull()) {
        throwFault(fault);
    }

    if (!httpOk)
        throw TransportError{"unexpected http status: " +
                             std::to_string(status)};

    const auto responseElement =
        findChild(soapBody, action + QStringLiteral("Response"));
    if (responseElement.isNull())
        throw TransportError{"control response has no " +
                             action.toStdString() + "Response element"};

    ControlResult result;
    for (auto e = responseElement.firstChildElement(); !e.isNull();
         e = e.nextSiblingElement()) {
        result.add(e.localName().isEmpty() ? e.tagName() : e.localName(),
                   e.text());
    }

    return result;
}

ControlResult ControlClient::send(const Device &device,
                                  const ControlCommand &command) const {
    const auto &serviceType = command.serviceType.isEmpty()
                                  ? device.serviceType
                                  : command.serviceType;

    LOGD("control action " << command.action << " on " << device.udn);

    HttpClient::Request request;
    request.url = device.controlUrl;
    request.verb = QByteArrayLiteral("POST");
    request.timeout = m_timeout;
    request.headers = {
        {QByteArrayLiteral("Content-Type"),
         QByteArrayLiteral("text/xml; charset=\"utf-8\"")},
        {QByteArrayLiteral("SOAPACTION"),
         soapAction(serviceType, command.action)}};
    request.body = makeEnvelope(serviceType, command);

    auto response = HttpClient::send(request);

    try {
        return decodeResponse(response.status, response.body, command.action);
    } catch (const ControlFault &fault) {
        LOGW("control fault from " << device.udn << ": " << fault.code()
                                   << " " << fault.description());
        throw;
    }
}
