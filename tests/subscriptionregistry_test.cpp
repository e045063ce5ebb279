/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "subscriptionregistry.h"

#include <QString>
#include <QUrl>
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include "errors.hpp"
#include "fakeeventingclient.h"

using namespace std::chrono_literals;

static EventHandler makeHandler(int *counter) {
    EventHandler handler;
    handler.onEvent = [counter](const Event &) { ++*counter; };
    return handler;
}

TEST_CASE("Subscription registry", "[registry]") {
    auto client = std::make_shared<FakeEventingClient>();
    auto now = SubscriptionRegistry::Clock::time_point{} + 1000s;
    SubscriptionRegistry registry{client, [&now] { return now; }};
    const QUrl base{QStringLiteral("http://192.168.1.2:5000/wemo")};
    const auto d1 = makeTestDevice(QStringLiteral("uuid:d1"), 10);

    SECTION("subscribe") {
        int events = 0;
        auto sid = registry.subscribe(d1, base, 300s, makeHandler(&events));

        REQUIRE(sid == QStringLiteral("uuid:sid-1"));
        REQUIRE(registry.size() == 1);
        REQUIRE(registry.ids() == std::vector<QString>{sid});

        auto calls = client->calls();
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0].eventUrl == d1.eventUrl);
        REQUIRE(calls[0].duration == 300s);
        REQUIRE(calls[0].callbackUrl.host() == QStringLiteral("192.168.1.2"));
        REQUIRE(calls[0].callbackUrl.path().startsWith(
            QStringLiteral("/wemo/")));

        auto s = registry.snapshot(sid);
        REQUIRE(s.has_value());
        REQUIRE(s->device == d1);
        REQUIRE(s->expiry == now + 300s);
        REQUIRE(s->renewalDeadline == now + 200s);
        REQUIRE(SubscriptionRegistry::callbackUrl(base, s->path) ==
                calls[0].callbackUrl);

        auto route = registry.route(s->path);
        REQUIRE(route.has_value());
        REQUIRE(route->sid == sid);

        auto handler = registry.lookup(sid);
        REQUIRE(handler.has_value());
        handler->onEvent(Event{sid, {}});
        REQUIRE(events == 1);
    }

    SECTION("lookup of unknown id") {
        REQUIRE_FALSE(registry.lookup(QStringLiteral("uuid:none")).has_value());
        REQUIRE_FALSE(registry.route(QStringLiteral("none")).has_value());
        REQUIRE_FALSE(
            registry.snapshot(QStringLiteral("uuid:none")).has_value());
    }

    SECTION("failed subscribe leaves no state") {
        client->failSubscribe = true;
        QString path;
        client->onSubscribe = [&](const QUrl &url) {
            path = url.path().section('/', -1);
        };

        int events = 0;
        REQUIRE_THROWS_AS(registry.subscribe(d1, base, 300s,
                                             makeHandler(&events)),
                          SubscribeError);
        REQUIRE(registry.size() == 0);
        REQUIRE_FALSE(path.isEmpty());
        REQUIRE_FALSE(registry.route(path).has_value());
        REQUIRE_FALSE(registry.nextRenewalDeadline().has_value());
    }

    SECTION("route is reserved while subscribe is in flight") {
        bool reserved = false;
        client->onSubscribe = [&](const QUrl &url) {
            auto route = registry.route(url.path().section('/', -1));
            reserved = route.has_value() && route->sid.isEmpty() &&
                       static_cast<bool>(route->handler.onEvent);
        };

        int events = 0;
        registry.subscribe(d1, base, 300s, makeHandler(&events));
        REQUIRE(reserved);
    }

    SECTION("subscribe without handler") {
        REQUIRE_THROWS_AS(registry.subscribe(d1, base, 300s, {}),
                          SubscribeError);
        REQUIRE(client->calls().empty());
    }

    SECTION("renew") {
        int events = 0;
        auto sid = registry.subscribe(d1, base, 300s, makeHandler(&events));

        now += 200s;
        REQUIRE(registry.renew(sid) == now + 300s);
        REQUIRE(client->count(QStringLiteral("RENEW")) == 1);
        REQUIRE(registry.snapshot(sid)->renewalDeadline == now + 200s);
    }

    SECTION("renew with granted duration") {
        client->grantedDuration = 90s;
        int events = 0;
        auto sid = registry.subscribe(d1, base, 300s, makeHandler(&events));
        REQUIRE(registry.snapshot(sid)->expiry == now + 90s);
        REQUIRE(registry.snapshot(sid)->renewalDeadline == now + 60s);
    }

    SECTION("renew of unknown id makes no request") {
        try {
            registry.renew(QStringLiteral("uuid:none"));
            FAIL("renew did not fail");
        } catch (const RenewError &e) {
            REQUIRE(e.sid() == QStringLiteral("uuid:none"));
            REQUIRE(e.reason() == RenewError::Reason::UnknownSubscription);
        }
        REQUIRE(client->calls().empty());
    }

    SECTION("rejected renew removes subscription") {
        int events = 0;
        auto sid = registry.subscribe(d1, base, 300s, makeHandler(&events));
        auto path = registry.snapshot(sid)->path;

        client->rejectRenew = true;
        REQUIRE_THROWS_AS(registry.renew(sid), RenewError);
        REQUIRE_FALSE(registry.lookup(sid).has_value());
        REQUIRE_FALSE(registry.route(path).has_value());
    }

    SECTION("unsubscribe") {
        int events = 0;
        auto sid = registry.subscribe(d1, base, 300s, makeHandler(&events));
        auto path = registry.snapshot(sid)->path;

        client->failUnsubscribe = true;
        registry.unsubscribe(sid);

        REQUIRE(client->count(QStringLiteral("UNSUBSCRIBE")) == 1);
        REQUIRE(registry.size() == 0);
        REQUIRE_FALSE(registry.lookup(sid).has_value());
        REQUIRE_FALSE(registry.route(path).has_value());

        registry.unsubscribe(sid);
        REQUIRE(client->count(QStringLiteral("UNSUBSCRIBE")) == 1);
    }

    SECTION("duplicates per device are kept apart") {
        int events1 = 0;
        int events2 = 0;
        auto sid1 = registry.subscribe(d1, base, 300s, makeHandler(&events1));
        auto sid2 = registry.subscribe(d1, base, 300s, makeHandler(&events2));

        REQUIRE(sid1 != sid2);
        REQUIRE(registry.size() == 2);
        REQUIRE(registry.snapshot(sid1)->path !=
                registry.snapshot(sid2)->path);

        registry.unsubscribe(sid1);
        REQUIRE(registry.lookup(sid2).has_value());
        registry.lookup(sid2)->onEvent(Event{sid2, {}});
        REQUIRE(events1 == 0);
        REQUIRE(events2 == 1);
    }

    SECTION("renewal deadlines") {
        int events = 0;
        auto sid1 = registry.subscribe(d1, base, 300s, makeHandler(&events));
        now += 60s;
        auto sid2 =
            registry.subscribe(makeTestDevice(QStringLiteral("uuid:d2"), 11),
                               base, 90s, makeHandler(&events));

        REQUIRE(registry.nextRenewalDeadline() == now + 60s);
        REQUIRE(registry.dueForRenewal(now).empty());
        REQUIRE(registry.dueForRenewal(now + 60s) ==
                std::vector<QString>{sid2});
        REQUIRE(registry.dueForRenewal(now + 140s).size() == 2);
        static_cast<void>(sid1);
    }

    SECTION("unsubscribe all") {
        int events = 0;
        registry.subscribe(d1, base, 300s, makeHandler(&events));
        registry.subscribe(makeTestDevice(QStringLiteral("uuid:d2"), 11), base,
                           300s, makeHandler(&events));

        registry.unsubscribeAll();
        REQUIRE(registry.size() == 0);
        REQUIRE(client->count(QStringLiteral("UNSUBSCRIBE")) == 2);
    }

    SECTION("change callback") {
        int changes = 0;
        registry.setChangedCallback([&changes] { ++changes; });

        int events = 0;
        auto sid = registry.subscribe(d1, base, 300s, makeHandler(&events));
        registry.renew(sid);
        registry.unsubscribe(sid);
        REQUIRE(changes == 3);
    }
}

TEST_CASE("Concurrent subscriptions", "[registry]") {
    auto client = std::make_shared<FakeEventingClient>();
    auto registry = std::make_shared<SubscriptionRegistry>(client);
    const QUrl base{QStringLiteral("http://192.168.1.2:5000/wemo")};

    const int rounds = 50;
    std::vector<QString> sids1, sids2;
    std::atomic_int events1{0}, events2{0};

    auto worker = [&](const Device &device, std::vector<QString> &sids,
                      std::atomic_int &events) {
        for (int i = 0; i < rounds; ++i) {
            EventHandler handler;
            handler.onEvent = [&events](const Event &) { ++events; };
            sids.push_back(
                registry->subscribe(device, base, 300s, std::move(handler)));
        }
    };

    std::thread t1{worker, makeTestDevice(QStringLiteral("uuid:d1"), 10),
                   std::ref(sids1), std::ref(events1)};
    std::thread t2{worker, makeTestDevice(QStringLiteral("uuid:d2"), 11),
                   std::ref(sids2), std::ref(events2)};
    t1.join();
    t2.join();

    REQUIRE(registry->size() == 2 * rounds);

    for (const auto &sid : sids1) {
        REQUIRE(registry->snapshot(sid)->device.udn ==
                QStringLiteral("uuid:d1"));
        registry->lookup(sid)->onEvent(Event{sid, {}});
    }
    for (const auto &sid : sids2) {
        REQUIRE(registry->snapshot(sid)->device.udn ==
                QStringLiteral("uuid:d2"));
    }

    REQUIRE(events1 == rounds);
    REQUIRE(events2 == 0);
}
