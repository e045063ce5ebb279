/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef BINARYSWITCH_H
#define BINARYSWITCH_H

#include <QString>
#include <chrono>
#include <optional>
#include <ostream>

#include "controlclient.h"
#include "device.h"

enum class BinaryState { Off = 0, On = 1, OnWithoutLoad = 8 };
std::ostream &operator<<(std::ostream &os, BinaryState state);

// Accepts plain values and pipe separated Insight values ("8|1526...|...").
std::optional<BinaryState> parseBinaryState(const QString &value);
inline bool isOn(BinaryState state) { return state != BinaryState::Off; }

class BinarySwitch {
   public:
    static const int retryDelay = 500;  // 0.5s

    BinarySwitch(Device device, ControlClient client = ControlClient{});

    inline const auto &device() const { return m_device; }

    BinaryState state() const;
    BinaryState setState(bool on) const;
    inline auto turnOn() const { return setState(true); }
    inline auto turnOff() const { return setState(false); }
    BinaryState toggle() const;
    QString friendlyName() const;

    BinaryState stateWithRetry(std::chrono::milliseconds timeout) const;
    BinaryState turnOnWithRetry(std::chrono::milliseconds timeout) const;
    BinaryState turnOffWithRetry(std::chrono::milliseconds timeout) const;

   private:
    Device m_device;
    ControlClient m_client;

    template <typename Call>
    BinaryState withRetry(std::chrono::milliseconds timeout,
                          Call &&call) const;
};

#endif  // BINARYSWITCH_H
