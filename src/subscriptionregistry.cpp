/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "subscriptionregistry.h"

#include <QUuid>
#include <algorithm>

#include "errors.hpp"
#include "logger.hpp"

SubscriptionRegistry::SubscriptionRegistry(
    std::shared_ptr<EventingClient> client, NowFunc now)
    : m_client{std::move(client)}, m_now{std::move(now)} {}

SubscriptionRegistry::Clock::duration SubscriptionRegistry::renewalMargin(
    std::chrono::seconds granted) {
    return std::chrono::duration_cast<Clock::duration>(granted) * 2 / 3;
}

QUrl SubscriptionRegistry::callbackUrl(const QUrl &base, const QString &path) {
    auto url = base;
    auto basePath = base.path();
    if (!basePath.endsWith('/')) basePath.append('/');
    url.setPath(basePath + path);
    return url;
}

void SubscriptionRegistry::setChangedCallback(std::function<void()> callback) {
    std::lock_guard lock{m_mtx};
    m_changedCallback = std::move(callback);
}

void SubscriptionRegistry::notifyChanged() {
    std::function<void()> callback;
    {
        std::lock_guard lock{m_mtx};
        callback = m_changedCallback;
    }
    if (callback) callback();
}

void SubscriptionRegistry::removeLocked(const QString &sid) {
    auto it = m_subscriptions.find(sid);
    if (it == m_subscriptions.end()) return;
    m_routes.erase(it->second.path);
    m_subscriptions.erase(it);
}

QString SubscriptionRegistry::subscribe(const Device &device,
                                        const QUrl &callbackBaseUrl,
                                        std::chrono::seconds duration,
                                        EventHandler handler) {
    if (!handler.onEvent) throw SubscribeError{"event handler is missing"};
    if (!device.eventUrl.isValid())
        throw SubscribeError{"device has no event url"};

    const auto path = QUuid::createUuid().toString(QUuid::WithoutBraces);

    // device may send initial notify before subscribe response arrives
    {
        std::lock_guard lock{m_mtx};
        m_routes.emplace(path, Route{{}, handler});
    }

    EventingClient::Grant grant;
    try {
        grant = m_client->subscribe(device.eventUrl,
                                    callbackUrl(callbackBaseUrl, path),
                                    duration);
    } catch (const SubscribeError &e) {
        LOGW("subscribe failed: " << device.udn << " " << e.what());
        std::lock_guard lock{m_mtx};
        m_routes.erase(path);
        throw;
    }

    {
        std::lock_guard lock{m_mtx};

        if (m_subscriptions.count(grant.sid) > 0) {
            LOGW("device returned sid that is already in use: " << grant.sid);
            removeLocked(grant.sid);
        }

        const auto now = m_now();

        Subscription s;
        s.sid = grant.sid;
        s.device = device;
        s.requestedDuration = duration;
        s.grantedDuration = grant.duration;
        s.expiry = now + grant.duration;
        s.renewalDeadline = now + renewalMargin(grant.duration);
        s.callbackBaseUrl = callbackBaseUrl;
        s.path = path;
        s.handler = std::move(handler);

        m_routes[path] = Route{grant.sid, s.handler};
        m_subscriptions.emplace(grant.sid, std::move(s));
    }

    LOGI("subscription added: " << grant.sid << " " << device.udn);

    notifyChanged();

    return grant.sid;
}

SubscriptionRegistry::Clock::time_point SubscriptionRegistry::renew(
    const QString &sid) {
    QUrl eventUrl;
    std::chrono::seconds duration;

    {
        std::lock_guard lock{m_mtx};
        auto it = m_subscriptions.find(sid);
        if (it == m_subscriptions.end())
            throw RenewError{sid, RenewError::Reason::UnknownSubscription,
                             "unknown subscription: " + sid.toStdString()};
        eventUrl = it->second.device.eventUrl;
        duration = it->second.requestedDuration;
    }

    std::chrono::seconds granted;
    try {
        granted = m_client->renew(eventUrl, sid, duration);
    } catch (const RenewError &e) {
        LOGW("renew failed: " << sid << " " << e.what());
        bool present = false;
        {
            std::lock_guard lock{m_mtx};
            present = m_subscriptions.count(sid) > 0;
            removeLocked(sid);
        }

        // unsubscribed while request was in flight
        if (!present)
            throw RenewError{sid, RenewError::Reason::UnknownSubscription,
                             "subscription removed during renewal: " +
                                 sid.toStdString()};

        notifyChanged();
        throw;
    }

    Clock::time_point expiry;
    {
        std::lock_guard lock{m_mtx};
        auto it = m_subscriptions.find(sid);
        if (it == m_subscriptions.end())
            throw RenewError{sid, RenewError::Reason::UnknownSubscription,
                             "subscription removed during renewal: " +
                                 sid.toStdString()};

        const auto now = m_now();
        it->second.grantedDuration = granted;
        it->second.expiry = now + granted;
        it->second.renewalDeadline = now + renewalMargin(granted);
        expiry = it->second.expiry;
    }

    LOGD("subscription renewed: " << sid << " " << granted.count() << "s");

    notifyChanged();

    return expiry;
}

void SubscriptionRegistry::unsubscribe(const QString &sid) {
    QUrl eventUrl;

    {
        std::lock_guard lock{m_mtx};
        auto it = m_subscriptions.find(sid);
        if (it == m_subscriptions.end()) {
            LOGD("unsubscribe of unknown subscription: " << sid);
            return;
        }
        eventUrl = it->second.device.eventUrl;
        removeLocked(sid);
    }

    LOGI("subscription removed: " << sid);

    notifyChanged();

    try {
        m_client->unsubscribe(eventUrl, sid);
    } catch (const TransportError &e) {
        LOGW("unsubscribe request failed: " << sid << " " << e.what());
    }
}

void SubscriptionRegistry::unsubscribeAll() {
    for (const auto &sid : ids()) unsubscribe(sid);
}

std::optional<EventHandler> SubscriptionRegistry::lookup(
    const QString &sid) const {
    std::lock_guard lock{m_mtx};
    auto it = m_subscriptions.find(sid);
    if (it == m_subscriptions.end()) return std::nullopt;
    return it->second.handler;
}

std::optional<SubscriptionRegistry::Route> SubscriptionRegistry::route(
    const QString &path) const {
    std::lock_guard lock{m_mtx};
    auto it = m_routes.find(path);
    if (it == m_routes.end()) return std::nullopt;
    return it->second;
}

std::optional<Subscription> SubscriptionRegistry::snapshot(
    const QString &sid) const {
    std::lock_guard lock{m_mtx};
    auto it = m_subscriptions.find(sid);
    if (it == m_subscriptions.end()) return std::nullopt;
    return it->second;
}

std::vector<QString> SubscriptionRegistry::ids() const {
    std::lock_guard lock{m_mtx};
    std::vector<QString> list;
    list.reserve(m_subscriptions.size());
    for (const auto &[sid, _] : m_subscriptions) list.push_back(sid);
    return list;
}

size_t SubscriptionRegistry::size() const {
    std::lock_guard lock{m_mtx};
    return m_subscriptions.size();
}

std::vector<QString> SubscriptionRegistry::dueForRenewal(
    Clock::time_point now) const {
    std::lock_guard lock{m_mtx};
    std::vector<QString> list;
    for (const auto &[sid, s] : m_subscriptions) {
        if (s.renewalDeadline <= now) list.push_back(sid);
    }
    return list;
}

std::optional<SubscriptionRegistry::Clock::time_point>
SubscriptionRegistry::nextRenewalDeadline() const {
    std::lock_guard lock{m_mtx};
    if (m_subscriptions.empty()) return std::nullopt;
    return std::min_element(m_subscriptions.cbegin(), m_subscriptions.cend(),
                            [](const auto &a, const auto &b) {
                                return a.second.renewalDeadline <
                                       b.second.renewalDeadline;
                            })
        ->second.renewalDeadline;
}
