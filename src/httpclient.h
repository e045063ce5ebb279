/* Copyright (C) 2021-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef HTTPCLIENT_H
#define HTTPCLIENT_H

#include <QByteArray>
#include <QUrl>
#include <utility>
#include <vector>

/**
 * Blocking HTTP helper.
 *
 * Every call creates its own network access manager and spins a local
 * event loop, so it can be used from any thread as long as
 * QCoreApplication exists. Failures below HTTP level (connection refused,
 * timeout, DNS) are reported with TransportError. HTTP error statuses are
 * returned to the caller.
 */
class HttpClient {
   public:
    using Header = std::pair<QByteArray, QByteArray>;
    static const int defaultTimeout = 5000;  // 5s

    struct Request {
        QUrl url;
        QByteArray verb = QByteArrayLiteral("GET");
        std::vector<Header> headers;
        QByteArray body;
        int timeout = defaultTimeout;
    };

    struct Response {
        int status = 0;
        std::vector<Header> headers;
        QByteArray body;

        inline bool ok() const { return status >= 200 && status < 300; }
        QByteArray header(const QByteArray &name) const;
    };

    static Response send(const Request &request);
    static Response get(const QUrl &url, int timeout = defaultTimeout);

    HttpClient() = delete;
};

#endif  // HTTPCLIENT_H
