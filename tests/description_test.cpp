/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "description.h"

#include <QByteArray>
#include <QString>
#include <QUrl>
#include <catch2/catch_test_macros.hpp>

#include "errors.hpp"
#include "fakedevice.h"

TEST_CASE("Device description parser", "[description]") {
    const QUrl source{QStringLiteral("http://192.168.1.20:49153/setup.xml")};

    SECTION("wemo setup.xml") {
        auto device = DescriptionParser::parse(
            FakeDevice::setupXml(QStringLiteral("uuid:Socket-1_0-SN1")),
            source);

        REQUIRE(device.udn == QStringLiteral("uuid:Socket-1_0-SN1"));
        REQUIRE(device.friendlyName == QStringLiteral("Lamp"));
        REQUIRE(device.serialNumber == QStringLiteral("SN1"));
        REQUIRE(device.modelName == QStringLiteral("Socket"));
        REQUIRE(device.serviceType ==
                QStringLiteral("urn:Belkin:service:basicevent:1"));
        REQUIRE(device.location == source);
        REQUIRE(device.host() == QStringLiteral("192.168.1.20"));
        REQUIRE(device.port() == 49153);
        REQUIRE(device.controlUrl ==
                QUrl{QStringLiteral(
                    "http://192.168.1.20:49153/upnp/control/basicevent1")});
        REQUIRE(device.eventUrl ==
                QUrl{QStringLiteral(
                    "http://192.168.1.20:49153/upnp/event/basicevent1")});
        REQUIRE_FALSE(device.controlUrl.isRelative());
        REQUIRE_FALSE(device.eventUrl.isRelative());
    }

    SECTION("same document gives equal devices") {
        const auto xml = FakeDevice::setupXml(QStringLiteral("uuid:a"));
        REQUIRE(DescriptionParser::parse(xml, source) ==
                DescriptionParser::parse(xml, source));
        REQUIRE(DescriptionParser::parse(xml, source) !=
                DescriptionParser::parse(
                    FakeDevice::setupXml(QStringLiteral("uuid:b")), source));
    }

    SECTION("url base") {
        auto xml = QByteArrayLiteral(
            "<root><URLBase>http://10.0.0.5:49154/</URLBase><device>"
            "<UDN>uuid:x</UDN><serviceList><service>"
            "<serviceType>urn:Belkin:service:basicevent:1</serviceType>"
            "<controlURL>upnp/control/basicevent1</controlURL>"
            "<eventSubURL>/upnp/event/basicevent1</eventSubURL>"
            "</service></serviceList></device></root>");

        auto device = DescriptionParser::parse(xml, source);
        REQUIRE(device.controlUrl ==
                QUrl{QStringLiteral(
                    "http://10.0.0.5:49154/upnp/control/basicevent1")});
        REQUIRE(device.eventUrl ==
                QUrl{QStringLiteral(
                    "http://10.0.0.5:49154/upnp/event/basicevent1")});
        REQUIRE(device.location == source);
    }

    SECTION("unknown elements and embedded device") {
        auto xml = QByteArrayLiteral(
            "<root xmlns=\"urn:schemas-upnp-org:device-1-0\">"
            "<vendorExtension><a>1</a></vendorExtension>"
            "<device><UDN>uuid:bridge</UDN><unknown/>"
            "<deviceList><device><UDN>uuid:child</UDN><serviceList>"
            "<service><serviceType>urn:Belkin:service:bridge:1</serviceType>"
            "<controlURL>/upnp/control/bridge1</controlURL>"
            "<eventSubURL>/upnp/event/bridge1</eventSubURL>"
            "<extra>ignored</extra></service>"
            "</serviceList></device></deviceList>"
            "</device></root>");

        auto device = DescriptionParser::parse(xml, source);
        REQUIRE(device.udn == QStringLiteral("uuid:bridge"));
        REQUIRE(device.serviceType ==
                QStringLiteral("urn:Belkin:service:bridge:1"));
        REQUIRE(device.eventUrl.path() == QStringLiteral("/upnp/event/bridge1"));
    }

    SECTION("missing udn") {
        auto xml = QByteArrayLiteral(
            "<root><device><serviceList><service>"
            "<controlURL>/c</controlURL><eventSubURL>/e</eventSubURL>"
            "</service></serviceList></device></root>");
        REQUIRE_THROWS_AS(DescriptionParser::parse(xml, source),
                          MalformedDescription);
    }

    SECTION("missing event url") {
        auto xml = QByteArrayLiteral(
            "<root><device><UDN>uuid:x</UDN><serviceList><service>"
            "<serviceType>urn:Belkin:service:basicevent:1</serviceType>"
            "<controlURL>/c</controlURL>"
            "</service></serviceList></device></root>");
        REQUIRE_THROWS_AS(DescriptionParser::parse(xml, source),
                          MalformedDescription);
    }

    SECTION("not well-formed") {
        REQUIRE_THROWS_AS(
            DescriptionParser::parse(QByteArrayLiteral("<root><device>"),
                                     source),
            MalformedDescription);
        REQUIRE_THROWS_AS(DescriptionParser::parse({}, source),
                          MalformedDescription);
    }
}
