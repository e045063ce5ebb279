/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef UTILS_H
#define UTILS_H

#include <QNetworkInterface>
#include <QString>
#include <QStringList>

namespace Utils {
bool ethNetworkInf(const QNetworkInterface &interface);
bool localNetworkInf(const QNetworkInterface &interface);
bool wlanNetworkInf(const QNetworkInterface &interface);
QStringList networkInfs(bool onlyUp = true);
// Removes scope id ("fe80::1%eth0" => "fe80::1").
QString fixAddress(const QString &address);
}  // namespace Utils

#endif  // UTILS_H
