/* Copyright (C) 2019-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef DEVICE_H
#define DEVICE_H

#include <QDebug>
#include <QString>
#include <QUrl>
#include <ostream>

struct Device {
    QString udn;
    QString friendlyName;
    QUrl location;
    QUrl controlUrl;
    QUrl eventUrl;
    QString serviceType;
    QString deviceType;
    QString serialNumber;
    QString modelName;
    QString firmwareVersion;
    QString macAddress;

    inline auto host() const { return location.host(); }
    inline auto port() const { return location.port(); }

    bool operator==(const Device &other) const;
    inline bool operator!=(const Device &other) const {
        return !(*this == other);
    }
    friend QDebug operator<<(QDebug dbg, const Device &device);
    friend std::ostream &operator<<(std::ostream &os, const Device &device);
};

#endif  // DEVICE_H
