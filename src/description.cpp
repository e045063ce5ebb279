/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "description.h"

#include <QDomDocument>
#include <QDomElement>
#include <QDomNode>
#include <optional>
#include <vector>

#include "errors.hpp"
#include "logger.hpp"

namespace DescriptionParser {

struct ServiceEntry {
    QString type;
    QString controlUrl;
    QString eventUrl;
};

static QString localName(const QDomElement &e) {
    const auto name = e.tagName();
    if (const auto idx = name.indexOf(':'); idx != -1) return name.mid(idx + 1);
    return name;
}

static QDomElement firstChild(const QDomElement &parent, const QString &name) {
    for (auto e = parent.firstChildElement(); !e.isNull();
         e = e.nextSiblingElement()) {
        if (localName(e) == name) return e;
    }
    return {};
}

static QString childText(const QDomElement &parent, const QString &name) {
    return firstChild(parent, name).text().trimmed();
}

static void collectServices(const QDomElement &device,
                            std::vector<ServiceEntry> &services) {
    const auto serviceList = firstChild(device, QStringLiteral("serviceList"));
    for (auto s = serviceList.firstChildElement(); !s.isNull();
         s = s.nextSiblingElement()) {
        if (localName(s) != QStringLiteral("service")) continue;
        services.push_back({childText(s, QStringLiteral("serviceType")),
                            childText(s, QStringLiteral("controlURL")),
                            childText(s, QStringLiteral("eventSubURL"))});
    }

    // embedded devices
    const auto deviceList = firstChild(device, QStringLiteral("deviceList"));
    for (auto d = deviceList.firstChildElement(); !d.isNull();
         d = d.nextSiblingElement()) {
        if (localName(d) == QStringLiteral("device"))
            collectServices(d, services);
    }
}

static std::optional<ServiceEntry> selectService(
    const std::vector<ServiceEntry> &services) {
    for (const auto &s : services) {
        if (s.type == QLatin1String{basicEventServiceType} &&
            !s.controlUrl.isEmpty() && !s.eventUrl.isEmpty())
            return s;
    }
    for (const auto &s : services) {
        if (!s.controlUrl.isEmpty() && !s.eventUrl.isEmpty()) return s;
    }
    return std::nullopt;
}

static QUrl resolve(const QUrl &base, const QString &ref) {
    auto url = base.resolved(QUrl{ref});
    if (!url.isValid() || url.isRelative() || url.host().isEmpty())
        throw MalformedDescription{"cannot resolve url: " + ref.toStdString()};
    return url;
}

Device parse(const QByteArray &data, const QUrl &sourceUrl) {
    QDomDocument doc;
    QString error;
    int line = 0;
    int column = 0;
    if (!doc.setContent(data, false, &error, &line, &column)) {
        throw MalformedDescription{"description parse error: " +
                                   error.toStdString() + " at " +
                                   std::to_string(line) + ":" +
                                   std::to_string(column)};
    }

    const auto root = doc.documentElement();
    const auto device = firstChild(root, QStringLiteral("device"));
    if (device.isNull())
        throw MalformedDescription{"description has no device element"};

    Device d;
    d.udn = childText(device, QStringLiteral("UDN"));
    if (d.udn.isEmpty()) throw MalformedDescription{"description has no UDN"};

    std::vector<ServiceEntry> services;
    collectServices(device, services);
    auto service = selectService(services);
    if (!service)
        throw MalformedDescription{
            "description has no service with control and event url"};

    const auto urlBase = childText(root, QStringLiteral("URLBase"));
    const auto base = urlBase.isEmpty() ? sourceUrl : QUrl{urlBase};

    d.location = sourceUrl;
    d.controlUrl = resolve(base, service->controlUrl);
    d.eventUrl = resolve(base, service->eventUrl);
    d.serviceType = service->type;
    d.friendlyName = childText(device, QStringLiteral("friendlyName"));
    d.deviceType = childText(device, QStringLiteral("deviceType"));
    d.serialNumber = childText(device, QStringLiteral("serialNumber"));
    d.modelName = childText(device, QStringLiteral("modelName"));
    d.firmwareVersion = childText(device, QStringLiteral("firmwareVersion"));
    d.macAddress = childText(device, QStringLiteral("macAddress"));

    LOGT("parsed description: " << d);

    return d;
}

}  // namespace DescriptionParser
