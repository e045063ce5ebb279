/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "subscriptions.h"

#include "errors.hpp"
#include "logger.hpp"

Subscriptions::Subscriptions(Config config)
    : Subscriptions{std::move(config), std::make_shared<HttpEventingClient>()} {
}

Subscriptions::Subscriptions(Config config,
                             std::shared_ptr<EventingClient> client)
    : m_config{std::move(config)},
      m_registry{std::make_shared<SubscriptionRegistry>(std::move(client))},
      m_scheduler{m_registry},
      m_listener{m_registry, m_config.listener} {}

Subscriptions::~Subscriptions() { stop(); }

void Subscriptions::start() {
    if (m_started) return;

    m_listener.startListening();
    m_scheduler.start();
    m_started = true;
}

void Subscriptions::stop() {
    if (!m_started) return;

    LOGD("stopping subscriptions: " << m_registry->size());

    m_scheduler.stop();
    m_registry->unsubscribeAll();
    m_listener.stopListening();
    m_started = false;
}

QString Subscriptions::subscribe(const Device &device, EventHandler handler) {
    return subscribe(device, m_config.duration, std::move(handler));
}

QString Subscriptions::subscribe(const Device &device,
                                 std::chrono::seconds duration,
                                 EventHandler handler) {
    if (!m_started) throw SubscribeError{"subscriptions are not started"};

    return m_registry->subscribe(device, m_listener.callbackBaseUrl(),
                                 duration, std::move(handler));
}

void Subscriptions::unsubscribe(const QString &sid) {
    m_registry->unsubscribe(sid);
}

SubscriptionRegistry::Clock::time_point Subscriptions::renew(
    const QString &sid) {
    return m_registry->renew(sid);
}
