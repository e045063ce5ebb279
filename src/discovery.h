/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef DISCOVERY_H
#define DISCOVERY_H

#include <QByteArray>
#include <QHostAddress>
#include <QString>
#include <QUrl>
#include <chrono>
#include <optional>
#include <vector>

#include "device.h"

class DiscoveryClient {
   public:
    static const quint16 ssdpPort = 1900;
    static const std::vector<quint16> defaultProbePorts;

    struct Config {
        QHostAddress group{QStringLiteral("239.255.255.250")};
        quint16 port = ssdpPort;
        QString searchTarget =
            QStringLiteral("urn:Belkin:service:basicevent:1");
        int mx = 3;
        QHostAddress bindAddress{QHostAddress::AnyIPv4};
    };

    DiscoveryClient();
    explicit DiscoveryClient(Config config);

    /**
     * Sends one M-SEARCH request and collects devices that respond within
     * timeout. Description documents are fetched while replies are being
     * collected and every fetch is limited to the remaining time.
     *
     * Returns empty list when nothing responds. Throws TransportError when
     * search socket cannot be bound or request cannot be sent.
     */
    std::vector<Device> discover(std::chrono::milliseconds timeout) const;
    std::optional<Device> findBySerial(const QString &serialNumber,
                                       std::chrono::milliseconds timeout) const;

    // Locates device with known address and unknown port.
    static std::optional<Device> probe(
        const QString &host,
        const std::vector<quint16> &ports = defaultProbePorts,
        std::chrono::milliseconds timeout = std::chrono::seconds{2});

    static QByteArray makeSearchRequest(const Config &config);
    static std::optional<QUrl> locationFromReply(const QByteArray &datagram);

   private:
    Config m_config;
};

#endif  // DISCOVERY_H
