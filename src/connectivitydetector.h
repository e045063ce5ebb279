/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef CONNECTIVITYDETECTOR_H
#define CONNECTIVITYDETECTOR_H

#include <QString>
#include <QStringList>
#include <mutex>

#include "singleton.h"

/**
 * Picks network interface and IPv4 address which is advertised to devices
 * in callback URLs. Ethernet is preferred over WLAN, loopback is used only
 * when nothing else is connected.
 */
class ConnectivityDetector : public Singleton<ConnectivityDetector> {
   public:
    ConnectivityDetector() = default;

    bool networkConnected() const;
    bool selectNetworkIf(QString &ifname, QString &address) const;
    void setPreferredNetworkIf(const QString &ifname);
    void update();

   private:
    mutable std::mutex m_mtx;
    QString m_ifname;
    QString m_prefIfname;

    static void selectIfnameCandidates(QStringList &ethCandidates,
                                       QStringList &wlanCandidates,
                                       QStringList &localCandidates);
};

#endif  // CONNECTIVITYDETECTOR_H
