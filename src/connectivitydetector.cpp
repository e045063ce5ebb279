/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "connectivitydetector.h"

#include <QNetworkInterface>

#include "logger.hpp"
#include "utils.h"

bool ConnectivityDetector::networkConnected() const {
    std::lock_guard lock{m_mtx};
    return !m_ifname.isEmpty();
}

void ConnectivityDetector::setPreferredNetworkIf(const QString &ifname) {
    {
        std::lock_guard lock{m_mtx};
        if (m_prefIfname == ifname) return;
        m_prefIfname = ifname;
    }
    update();
}

void ConnectivityDetector::selectIfnameCandidates(
    QStringList &ethCandidates, QStringList &wlanCandidates,
    QStringList &localCandidates) {
    for (const auto &interface : QNetworkInterface::allInterfaces()) {
        if (interface.flags().testFlag(QNetworkInterface::IsRunning) &&
            !interface.addressEntries().isEmpty()) {
            if (Utils::ethNetworkInf(interface)) {
                ethCandidates << interface.name();
            } else if (Utils::wlanNetworkInf(interface)) {
                wlanCandidates << interface.name();
            } else if (Utils::localNetworkInf(interface)) {
                localCandidates << interface.name();
            }
        }
    }
}

void ConnectivityDetector::update() {
    QStringList ethCandidates;
    QStringList wlanCandidates;
    QStringList localCandidates;

    selectIfnameCandidates(ethCandidates, wlanCandidates, localCandidates);

    std::lock_guard lock{m_mtx};

    QString newIfname;

    if (ethCandidates.isEmpty() && wlanCandidates.isEmpty() &&
        localCandidates.isEmpty()) {
        LOGW("no connected network interface found");
    } else if (!m_prefIfname.isEmpty() &&
               (ethCandidates.contains(m_prefIfname) ||
                wlanCandidates.contains(m_prefIfname) ||
                localCandidates.contains(m_prefIfname))) {
        LOGD("preferred network interface found: " << m_prefIfname);
        newIfname = m_prefIfname;
    } else if (!ethCandidates.isEmpty()) {
        newIfname = ethCandidates.first();
    } else if (!wlanCandidates.isEmpty()) {
        newIfname = wlanCandidates.first();
    } else {
        newIfname = localCandidates.first();
    }

    if (m_ifname != newIfname) {
        LOGD("connected network interface changed: " << newIfname);
        m_ifname = newIfname;
    }
}

bool ConnectivityDetector::selectNetworkIf(QString &ifname,
                                           QString &address) const {
    std::lock_guard lock{m_mtx};

    if (m_ifname.isEmpty()) return false;

    auto interface = QNetworkInterface::interfaceFromName(m_ifname);
    if (!interface.isValid() ||
        !interface.flags().testFlag(QNetworkInterface::IsUp) ||
        !interface.flags().testFlag(QNetworkInterface::IsRunning))
        return false;

    // devices of this family reach subscribers over IPv4 only
    for (const auto &a : interface.addressEntries()) {
        auto ha = a.ip();
        if (ha.protocol() == QAbstractSocket::IPv4Protocol) {
            ifname = m_ifname;
            address = Utils::fixAddress(ha.toString());
            return true;
        }
    }

    LOGW("cannot find valid ip addr for interface: " << m_ifname);

    return false;
}
