/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef SUBSCRIPTIONREGISTRY_H
#define SUBSCRIPTIONREGISTRY_H

#include <QString>
#include <QUrl>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "device.h"
#include "event.h"
#include "eventingclient.h"

struct Subscription {
    using Clock = std::chrono::steady_clock;

    QString sid;
    Device device;
    std::chrono::seconds requestedDuration{0};
    std::chrono::seconds grantedDuration{0};
    Clock::time_point expiry;
    Clock::time_point renewalDeadline;
    QUrl callbackBaseUrl;
    QString path;
    EventHandler handler;
};

/**
 * Owns all live subscriptions.
 *
 * Entries are keyed by SID returned by device. Callback path segment is
 * generated per subscription and routes notifications to it. All methods
 * are thread safe. Network calls are made without holding the lock.
 */
class SubscriptionRegistry {
   public:
    using Clock = Subscription::Clock;
    using NowFunc = std::function<Clock::time_point()>;

    struct Route {
        // empty while subscribe request is in flight
        QString sid;
        EventHandler handler;
    };

    explicit SubscriptionRegistry(std::shared_ptr<EventingClient> client,
                                  NowFunc now = Clock::now);

    // Throws SubscribeError.
    QString subscribe(const Device &device, const QUrl &callbackBaseUrl,
                      std::chrono::seconds duration, EventHandler handler);
    // Returns new expiry. Throws RenewError.
    Clock::time_point renew(const QString &sid);
    void unsubscribe(const QString &sid);
    void unsubscribeAll();

    std::optional<EventHandler> lookup(const QString &sid) const;
    std::optional<Route> route(const QString &path) const;
    std::optional<Subscription> snapshot(const QString &sid) const;
    std::vector<QString> ids() const;
    size_t size() const;

    std::vector<QString> dueForRenewal(Clock::time_point now) const;
    std::optional<Clock::time_point> nextRenewalDeadline() const;

    inline auto now() const { return m_now(); }
    void setChangedCallback(std::function<void()> callback);

    // Renewal is due after two thirds of granted duration.
    static Clock::duration renewalMargin(std::chrono::seconds granted);
    static QUrl callbackUrl(const QUrl &base, const QString &path);

   private:
    std::shared_ptr<EventingClient> m_client;
    NowFunc m_now;
    mutable std::mutex m_mtx;
    std::map<QString, Subscription> m_subscriptions;
    std::map<QString, Route> m_routes;
    std::function<void()> m_changedCallback;

    void notifyChanged();
    void removeLocked(const QString &sid);
};

#endif  // SUBSCRIPTIONREGISTRY_H
