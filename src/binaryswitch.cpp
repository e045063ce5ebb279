/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "binaryswitch.h"

#include <thread>
#include <utility>

#include "description.h"
#include "errors.hpp"
#include "logger.hpp"

std::ostream &operator<<(std::ostream &os, BinaryState state) {
    switch (state) {
        case BinaryState::Off:
            os << "off";
            break;
        case BinaryState::On:
            os << "on";
            break;
        case BinaryState::OnWithoutLoad:
            os << "on-without-load";
            break;
    }
    return os;
}

std::optional<BinaryState> parseBinaryState(const QString &value) {
    bool ok = false;
    const auto code = value.section('|', 0, 0).trimmed().toInt(&ok);
    if (!ok) return std::nullopt;

    switch (code) {
        case 0:
            return BinaryState::Off;
        case 1:
            return BinaryState::On;
        case 8:
            return BinaryState::OnWithoutLoad;
    }

    return std::nullopt;
}

static BinaryState stateFromResult(const ControlResult &result) {
    const auto value = result.value(QStringLiteral("BinaryState"));
    if (!value) throw TransportError{"response has no BinaryState"};

    auto state = parseBinaryState(*value);
    if (!state)
        throw TransportError{"invalid BinaryState: " + value->toStdString()};

    return *state;
}

BinarySwitch::BinarySwitch(Device device, ControlClient client)
    : m_device{std::move(device)}, m_client{client} {}

BinaryState BinarySwitch::state() const {
    auto result = m_client.send(
        m_device, {DescriptionParser::basicEventServiceType,
                   QStringLiteral("GetBinaryState"),
                   {}});
    return stateFromResult(result);
}

BinaryState BinarySwitch::setState(bool on) const {
    auto result = m_client.send(
        m_device,
        {DescriptionParser::basicEventServiceType,
         QStringLiteral("SetBinaryState"),
         {{QStringLiteral("BinaryState"),
           on ? QStringLiteral("1") : QStringLiteral("0")}}});

    // device answers "Error" when it is already in requested state
    if (result.value(QStringLiteral("BinaryState")) ==
        QStringLiteral("Error")) {
        LOGD("set state rejected, reading current state: " << m_device.udn);
        return state();
    }

    return stateFromResult(result);
}

BinaryState BinarySwitch::toggle() const { return setState(!isOn(state())); }

QString BinarySwitch::friendlyName() const {
    auto result =
        m_client.send(m_device, {DescriptionParser::basicEventServiceType,
                                 QStringLiteral("GetFriendlyName"),
                                 {}});
    return result.value(QStringLiteral("FriendlyName"))
        .value_or(m_device.friendlyName);
}

template <typename Call>
BinaryState BinarySwitch::withRetry(std::chrono::milliseconds timeout,
                                    Call &&call) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto delay = std::chrono::milliseconds{retryDelay};

    while (true) {
        try {
            return call();
        } catch (const TransportError &err) {
            if (std::chrono::steady_clock::now() + delay >= deadline) throw;
            LOGD("retrying after transport error: " << err.what());
        }
        std::this_thread::sleep_for(delay);
    }
}

BinaryState BinarySwitch::stateWithRetry(
    std::chrono::milliseconds timeout) const {
    return withRetry(timeout, [this] { return state(); });
}

BinaryState BinarySwitch::turnOnWithRetry(
    std::chrono::milliseconds timeout) const {
    return withRetry(timeout, [this] { return turnOn(); });
}

BinaryState BinarySwitch::turnOffWithRetry(
    std::chrono::milliseconds timeout) const {
    return withRetry(timeout, [this] { return turnOff(); });
}
