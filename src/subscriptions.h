/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef SUBSCRIPTIONS_H
#define SUBSCRIPTIONS_H

#include <QString>
#include <QUrl>
#include <chrono>
#include <memory>

#include "callbacklistener.h"
#include "device.h"
#include "event.h"
#include "eventingclient.h"
#include "renewalscheduler.h"
#include "subscriptionregistry.h"

/**
 * Eventing session: registry, renewal scheduler and callback listener
 * with common lifetime.
 *
 * stop() (also called from destructor) stops renewals, unsubscribes all
 * live subscriptions and only then releases listener's address.
 */
class Subscriptions {
   public:
    struct Config {
        CallbackListener::Config listener;
        std::chrono::seconds duration{300};
    };

    explicit Subscriptions(Config config);
    Subscriptions(Config config, std::shared_ptr<EventingClient> client);
    ~Subscriptions();

    // Throws TransportError when listener cannot be started.
    void start();
    void stop();
    inline bool started() const { return m_started; }

    // Throws SubscribeError.
    QString subscribe(const Device &device, EventHandler handler);
    QString subscribe(const Device &device, std::chrono::seconds duration,
                      EventHandler handler);
    void unsubscribe(const QString &sid);
    SubscriptionRegistry::Clock::time_point renew(const QString &sid);

    inline auto registry() const { return m_registry; }
    inline auto callbackBaseUrl() const { return m_listener.callbackBaseUrl(); }

   private:
    Config m_config;
    std::shared_ptr<SubscriptionRegistry> m_registry;
    RenewalScheduler m_scheduler;
    CallbackListener m_listener;
    bool m_started = false;
};

#endif  // SUBSCRIPTIONS_H
