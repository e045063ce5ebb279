/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "utils.h"

namespace Utils {

bool ethNetworkInf(const QNetworkInterface &interface) {
#if QT_VERSION < QT_VERSION_CHECK(5, 11, 0)
    return interface.name().startsWith('e') ||
           interface.name().startsWith("rndis");
#else
    return interface.type() == QNetworkInterface::Ethernet;
#endif
}

bool localNetworkInf(const QNetworkInterface &interface) {
#if QT_VERSION < QT_VERSION_CHECK(5, 11, 0)
    return interface.name().startsWith("lo");
#else
    return interface.type() == QNetworkInterface::Loopback;
#endif
}

bool wlanNetworkInf(const QNetworkInterface &interface) {
#if QT_VERSION < QT_VERSION_CHECK(5, 11, 0)
    return interface.name().startsWith('w') ||
           interface.name().startsWith("tether");
#else
    return interface.type() == QNetworkInterface::Wifi;
#endif
}

QStringList networkInfs(bool onlyUp) {
    QStringList list;
    for (const auto &interface : QNetworkInterface::allInterfaces()) {
        if (!interface.isValid()) continue;
        if (onlyUp && !interface.flags().testFlag(QNetworkInterface::IsRunning))
            continue;
        if (ethNetworkInf(interface) || wlanNetworkInf(interface) ||
            localNetworkInf(interface))
            list.append(interface.name());
    }
    return list;
}

QString fixAddress(const QString &address) {
    if (const auto idx = address.indexOf('%'); idx != -1) {
        return address.left(idx);
    }

    return address;
}

}  // namespace Utils
