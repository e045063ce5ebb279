/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "subscriptions.h"

#include <QHostAddress>
#include <QString>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>

#include "errors.hpp"
#include "fakeeventingclient.h"
#include "httpclient.h"

using namespace std::chrono_literals;

static Subscriptions::Config loopbackConfig() {
    Subscriptions::Config config;
    config.listener.address = QHostAddress::LocalHost;
    config.listener.advertiseAddress = QStringLiteral("127.0.0.1");
    config.listener.pathPrefix = QStringLiteral("/events/");
    config.duration = 120s;
    return config;
}

TEST_CASE("Subscriptions session", "[subscriptions]") {
    auto client = std::make_shared<FakeEventingClient>();
    Subscriptions subscriptions{loopbackConfig(), client};

    EventHandler handler;
    handler.onEvent = [](const Event &) {};
    const auto d1 = makeTestDevice(QStringLiteral("uuid:d1"), 10);
    const auto d2 = makeTestDevice(QStringLiteral("uuid:d2"), 11);

    SECTION("subscribe before start") {
        REQUIRE_FALSE(subscriptions.started());
        REQUIRE_THROWS_AS(subscriptions.subscribe(d1, handler),
                          SubscribeError);
        REQUIRE(client->calls().empty());
    }

    SECTION("lifecycle") {
        subscriptions.start();
        REQUIRE(subscriptions.started());

        const auto base = subscriptions.callbackBaseUrl();
        REQUIRE(base.path() == QStringLiteral("/events"));
        REQUIRE(base.port() > 0);

        auto sid1 = subscriptions.subscribe(d1, handler);
        auto sid2 = subscriptions.subscribe(d2, 600s, handler);

        auto calls = client->calls();
        REQUIRE(calls.size() == 2);
        REQUIRE(calls[0].duration == 120s);
        REQUIRE(calls[1].duration == 600s);
        REQUIRE(calls[0].callbackUrl.toString().startsWith(
            base.toString() + '/'));
        REQUIRE(subscriptions.registry()->size() == 2);

        subscriptions.renew(sid1);
        REQUIRE(client->count(QStringLiteral("RENEW")) == 1);

        subscriptions.unsubscribe(sid2);
        REQUIRE(subscriptions.registry()->size() == 1);

        subscriptions.stop();
        REQUIRE_FALSE(subscriptions.started());
        REQUIRE(subscriptions.registry()->size() == 0);
        REQUIRE(client->count(QStringLiteral("UNSUBSCRIBE")) == 2);

        // listener address is released
        HttpClient::Request request;
        request.url = calls[0].callbackUrl;
        request.verb = QByteArrayLiteral("NOTIFY");
        request.timeout = 2000;
        REQUIRE_THROWS_AS(HttpClient::send(request), TransportError);
    }

    SECTION("destructor unsubscribes") {
        {
            Subscriptions session{loopbackConfig(), client};
            session.start();
            session.subscribe(d1, handler);
        }
        REQUIRE(client->count(QStringLiteral("UNSUBSCRIBE")) == 1);
    }
}
