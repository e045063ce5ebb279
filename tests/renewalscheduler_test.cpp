/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "renewalscheduler.h"

#include <QString>
#include <QUrl>
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <thread>

#include "fakeeventingclient.h"

using namespace std::chrono_literals;

TEST_CASE("Renewal state machine", "[scheduler]") {
    auto client = std::make_shared<FakeEventingClient>();
    const auto start = SubscriptionRegistry::Clock::time_point{} + 1000s;
    auto now = start;
    auto registry = std::make_shared<SubscriptionRegistry>(
        client, [&now] { return now; });
    RenewalScheduler scheduler{registry};
    const QUrl base{QStringLiteral("http://192.168.1.2:5000/wemo")};
    const auto d1 = makeTestDevice(QStringLiteral("uuid:d1"), 10);

    int events = 0;
    int lost = 0;
    QString lostSid;
    EventHandler handler;
    handler.onEvent = [&events](const Event &) { ++events; };
    handler.onSubscriptionLost = [&](const QString &sid) {
        ++lost;
        lostSid = sid;
    };

    SECTION("renew at two thirds of duration") {
        auto sid = registry->subscribe(d1, base, 300s, handler);

        now = start + 100s;
        scheduler.tick(now);
        REQUIRE(client->count(QStringLiteral("RENEW")) == 0);

        now = start + 200s;
        scheduler.tick(now);
        REQUIRE(client->count(QStringLiteral("RENEW")) == 1);
        REQUIRE(client->calls().back().sid == sid);
        REQUIRE(registry->snapshot(sid)->expiry == now + 300s);
        REQUIRE(events == 0);

        scheduler.tick(now);
        REQUIRE(client->count(QStringLiteral("RENEW")) == 1);
    }

    SECTION("unsubscribed subscription is not renewed") {
        auto sid = registry->subscribe(d1, base, 300s, handler);
        registry->unsubscribe(sid);

        now = start + 200s;
        REQUIRE_NOTHROW(scheduler.tick(now));
        REQUIRE(scheduler.process(sid) == RenewalScheduler::State::Done);
        REQUIRE(client->count(QStringLiteral("RENEW")) == 0);
        REQUIRE(lost == 0);
    }

    SECTION("unsubscribe during rejected renew is not re-subscribed") {
        auto sid = registry->subscribe(d1, base, 300s, handler);
        client->onRenew = [&](const QString &renewed) {
            registry->unsubscribe(renewed);
            client->rejectRenew = true;
        };

        now = start + 200s;
        REQUIRE(scheduler.process(sid) == RenewalScheduler::State::Done);
        REQUIRE(client->count(QStringLiteral("SUBSCRIBE")) == 1);
        REQUIRE(client->count(QStringLiteral("UNSUBSCRIBE")) == 1);
        REQUIRE(registry->size() == 0);
        REQUIRE(lost == 0);
    }

    SECTION("rejected renew re-subscribes") {
        auto sid = registry->subscribe(d1, base, 300s, handler);
        client->rejectRenew = true;

        now = start + 200s;
        scheduler.tick(now);

        REQUIRE(client->count(QStringLiteral("RENEW")) == 1);
        REQUIRE(client->count(QStringLiteral("SUBSCRIBE")) == 2);
        REQUIRE_FALSE(registry->lookup(sid).has_value());
        REQUIRE(registry->size() == 1);

        auto newSid = registry->ids().front();
        REQUIRE(newSid != sid);
        auto s = registry->snapshot(newSid);
        REQUIRE(s->device == d1);
        REQUIRE(s->callbackBaseUrl == base);
        REQUIRE(s->requestedDuration == 300s);

        registry->lookup(newSid)->onEvent(Event{newSid, {}});
        REQUIRE(events == 1);
        REQUIRE(lost == 0);
    }

    SECTION("failed re-subscribe reports loss once") {
        auto sid = registry->subscribe(d1, base, 300s, handler);
        client->rejectRenew = true;
        client->failSubscribe = true;

        now = start + 200s;
        REQUIRE(scheduler.process(sid) == RenewalScheduler::State::Lost);
        REQUIRE(lost == 1);
        REQUIRE(lostSid == sid);
        REQUIRE(registry->size() == 0);

        scheduler.tick(now + 1000s);
        REQUIRE(lost == 1);
    }

    SECTION("loss without callback is silent") {
        handler.onSubscriptionLost = nullptr;
        auto sid = registry->subscribe(d1, base, 300s, handler);
        client->rejectRenew = true;
        client->failSubscribe = true;

        REQUIRE(scheduler.process(sid) == RenewalScheduler::State::Lost);
        REQUIRE(registry->size() == 0);
    }
}

TEST_CASE("Renewal scheduler thread", "[scheduler]") {
    auto client = std::make_shared<FakeEventingClient>();
    client->grantedDuration = 1s;
    auto registry = std::make_shared<SubscriptionRegistry>(client);
    RenewalScheduler scheduler{registry};

    scheduler.start();
    REQUIRE(scheduler.running());

    EventHandler handler;
    handler.onEvent = [](const Event &) {};
    registry->subscribe(makeTestDevice(QStringLiteral("uuid:d1"), 10),
                        QUrl{QStringLiteral("http://127.0.0.1:5000/wemo")},
                        300s, handler);

    // 1s grant => renewal every ~0.67s
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (client->count(QStringLiteral("RENEW")) < 2 &&
           std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(50ms);

    REQUIRE(client->count(QStringLiteral("RENEW")) >= 2);

    scheduler.stop();
    REQUIRE_FALSE(scheduler.running());

    const auto renewals = client->count(QStringLiteral("RENEW"));
    std::this_thread::sleep_for(1500ms);
    REQUIRE(client->count(QStringLiteral("RENEW")) == renewals);
}
