/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef EVENTINGCLIENT_H
#define EVENTINGCLIENT_H

#include <QByteArray>
#include <QString>
#include <QUrl>
#include <chrono>
#include <optional>

#include "httpclient.h"

/**
 * GENA exchange with device's event URL.
 *
 * subscribe throws SubscribeError, renew throws RenewError with Rejected
 * or Transport reason, unsubscribe throws TransportError.
 */
class EventingClient {
   public:
    struct Grant {
        QString sid;
        std::chrono::seconds duration{0};
    };

    virtual ~EventingClient() = default;
    virtual Grant subscribe(const QUrl &eventUrl, const QUrl &callbackUrl,
                            std::chrono::seconds duration) = 0;
    virtual std::chrono::seconds renew(const QUrl &eventUrl, const QString &sid,
                                       std::chrono::seconds duration) = 0;
    virtual void unsubscribe(const QUrl &eventUrl, const QString &sid) = 0;
};

class HttpEventingClient : public EventingClient {
   public:
    explicit HttpEventingClient(int timeout = HttpClient::defaultTimeout);

    Grant subscribe(const QUrl &eventUrl, const QUrl &callbackUrl,
                    std::chrono::seconds duration) override;
    std::chrono::seconds renew(const QUrl &eventUrl, const QString &sid,
                               std::chrono::seconds duration) override;
    void unsubscribe(const QUrl &eventUrl, const QString &sid) override;

    // "Second-1800" => 1800s, "Second-infinite" => fallback
    static std::optional<std::chrono::seconds> parseTimeout(
        const QByteArray &value, std::chrono::seconds fallback);
    static QByteArray timeoutHeader(std::chrono::seconds duration);

   private:
    int m_timeout;
};

#endif  // EVENTINGCLIENT_H
