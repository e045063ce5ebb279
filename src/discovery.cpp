/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "discovery.h"

#include <QNetworkDatagram>
#include <QUdpSocket>
#include <algorithm>
#include <set>

#include "description.h"
#include "errors.hpp"
#include "httpclient.h"
#include "logger.hpp"

const std::vector<quint16> DiscoveryClient::defaultProbePorts{49152, 49153,
                                                              49154, 49155};

DiscoveryClient::DiscoveryClient() : DiscoveryClient{Config{}} {}

DiscoveryClient::DiscoveryClient(Config config) : m_config{std::move(config)} {}

QByteArray DiscoveryClient::makeSearchRequest(const Config &config) {
    return QStringLiteral(
               "M-SEARCH * HTTP/1.1\r\n"
               "HOST: %1:%2\r\n"
               "MAN: \"ssdp:discover\"\r\n"
               "MX: %3\r\n"
               "ST: %4\r\n"
               "\r\n")
        .arg(config.group.toString())
        .arg(config.port)
        .arg(config.mx)
        .arg(config.searchTarget)
        .toUtf8();
}

std::optional<QUrl> DiscoveryClient::locationFromReply(
    const QByteArray &datagram) {
    const auto lines = datagram.split('\n');
    if (lines.isEmpty() || !lines.first().trimmed().startsWith("HTTP/1.1 200"))
        return std::nullopt;

    for (const auto &line : lines) {
        const auto idx = line.indexOf(':');
        if (idx <= 0) continue;
        if (line.left(idx).trimmed().toLower() != "location") continue;

        QUrl url{QString::fromUtf8(line.mid(idx + 1).trimmed())};
        if (url.isValid() && !url.isRelative()) return url;
        return std::nullopt;
    }

    return std::nullopt;
}

std::vector<Device> DiscoveryClient::discover(
    std::chrono::milliseconds timeout) const {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;

    QUdpSocket socket;
    if (!socket.bind(m_config.bindAddress, 0)) {
        throw TransportError{"cannot bind search socket: " +
                             socket.errorString().toStdString()};
    }
    socket.setSocketOption(QAbstractSocket::MulticastTtlOption, 2);

    if (socket.writeDatagram(makeSearchRequest(m_config), m_config.group,
                             m_config.port) == -1) {
        throw TransportError{"cannot send search request: " +
                             socket.errorString().toStdString()};
    }

    LOGD("search request sent: " << m_config.searchTarget);

    std::vector<Device> devices;
    std::set<QString> visited;

    auto remaining = [&deadline] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - clock::now());
    };

    while (remaining().count() > 0) {
        if (!socket.waitForReadyRead(static_cast<int>(remaining().count())))
            continue;

        while (socket.hasPendingDatagrams()) {
            const auto datagram = socket.receiveDatagram();
            const auto location = locationFromReply(datagram.data());
            if (!location) {
                LOGT("ignoring datagram from "
                     << datagram.senderAddress().toString());
                continue;
            }

            if (!visited.insert(location->toString()).second) continue;

            const auto left = remaining().count();
            if (left <= 0) {
                LOGD("no time left to fetch description: " << *location);
                break;
            }

            try {
                auto response =
                    HttpClient::get(*location, static_cast<int>(left));
                if (!response.ok()) {
                    LOGW("description fetch failed: " << *location
                                                      << " status "
                                                      << response.status);
                    continue;
                }

                auto device =
                    DescriptionParser::parse(response.body, *location);

                auto it = std::find_if(
                    devices.begin(), devices.end(),
                    [&](const auto &d) { return d.udn == device.udn; });
                if (it == devices.end()) {
                    LOGI("device found: " << device);
                    devices.push_back(std::move(device));
                } else {
                    *it = std::move(device);
                }
            } catch (const TransportError &e) {
                LOGW("description fetch error: " << *location << " "
                                                 << e.what());
            } catch (const MalformedDescription &e) {
                LOGW("invalid description: " << *location << " " << e.what());
            }
        }
    }

    LOGD("discovery finished: " << devices.size() << " device(s)");

    return devices;
}

std::optional<Device> DiscoveryClient::findBySerial(
    const QString &serialNumber, std::chrono::milliseconds timeout) const {
    for (auto &device : discover(timeout)) {
        if (device.serialNumber == serialNumber) return std::move(device);
    }
    return std::nullopt;
}

std::optional<Device> DiscoveryClient::probe(
    const QString &host, const std::vector<quint16> &ports,
    std::chrono::milliseconds timeout) {
    for (auto port : ports) {
        QUrl url;
        url.setScheme(QStringLiteral("http"));
        url.setHost(host);
        url.setPort(port);
        url.setPath(QStringLiteral("/setup.xml"));

        try {
            auto response =
                HttpClient::get(url, static_cast<int>(timeout.count()));
            if (!response.ok()) continue;
            auto device = DescriptionParser::parse(response.body, url);
            LOGI("device found on port " << port << ": " << device);
            return device;
        } catch (const TransportError &e) {
            LOGD("probe failed: " << url << " " << e.what());
        } catch (const MalformedDescription &e) {
            LOGD("probe failed: " << url << " " << e.what());
        }
    }

    return std::nullopt;
}
