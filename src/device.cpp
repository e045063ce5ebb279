/* Copyright (C) 2019-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "device.h"

bool Device::operator==(const Device &other) const {
    return udn == other.udn && friendlyName == other.friendlyName &&
           location == other.location && controlUrl == other.controlUrl &&
           eventUrl == other.eventUrl && serviceType == other.serviceType &&
           deviceType == other.deviceType &&
           serialNumber == other.serialNumber &&
           modelName == other.modelName &&
           firmwareVersion == other.firmwareVersion &&
           macAddress == other.macAddress;
}

QDebug operator<<(QDebug dbg, const Device &device) {
    dbg << "udn=" << device.udn << ", name=" << device.friendlyName
        << ", location=" << device.location
        << ", control=" << device.controlUrl << ", event=" << device.eventUrl;
    return dbg;
}

std::ostream &operator<<(std::ostream &os, const Device &device) {
    os << "udn=" << device.udn.toStdString()
       << ", name=" << device.friendlyName.toStdString()
       << ", location=" << device.location.toString().toStdString();
    return os;
}
