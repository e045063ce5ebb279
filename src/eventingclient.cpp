/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "eventingclient.h"

#include "errors.hpp"
#include "logger.hpp"

HttpEventingClient::HttpEventingClient(int timeout) : m_timeout{timeout} {}

std::optional<std::chrono::seconds> HttpEventingClient::parseTimeout(
    const QByteArray &value, std::chrono::seconds fallback) {
    const auto v = value.trimmed().toLower();
    if (!v.startsWith("second-")) return std::nullopt;

    const auto number = v.mid(7);
    if (number == "infinite") return fallback;

    bool ok = false;
    const auto secs = number.toLongLong(&ok);
    if (!ok || secs <= 0) return std::nullopt;

    return std::chrono::seconds{secs};
}

QByteArray HttpEventingClient::timeoutHeader(std::chrono::seconds duration) {
    return "Second-" + QByteArray::number(
                           static_cast<qlonglong>(duration.count()));
}

EventingClient::Grant HttpEventingClient::subscribe(
    const QUrl &eventUrl, const QUrl &callbackUrl,
    std::chrono::seconds duration) {
    HttpClient::Request request;
    request.url = eventUrl;
    request.verb = QByteArrayLiteral("SUBSCRIBE");
    request.timeout = m_timeout;
    request.headers = {
        {QByteArrayLiteral("CALLBACK"),
         '<' + callbackUrl.toString(QUrl::FullyEncoded).toUtf8() + '>'},
        {QByteArrayLiteral("NT"), QByteArrayLiteral("upnp:event")},
        {QByteArrayLiteral("TIMEOUT"), timeoutHeader(duration)}};

    HttpClient::Response response;
    try {
        response = HttpClient::send(request);
    } catch (const TransportError &e) {
        throw SubscribeError{std::string{"subscribe transport error: "} +
                             e.what()};
    }

    if (!response.ok())
        throw SubscribeError{"subscribe rejected with status " +
                             std::to_string(response.status)};

    Grant grant;
    grant.sid = QString::fromUtf8(response.header("SID").trimmed());
    if (grant.sid.isEmpty())
        throw SubscribeError{"subscribe response has no SID"};

    auto granted = parseTimeout(response.header("TIMEOUT"), duration);
    if (!granted) {
        LOGW("invalid timeout in subscribe response: "
             << response.header("TIMEOUT"));
    }
    grant.duration = granted.value_or(duration);

    LOGD("subscribed: " << grant.sid << " " << grant.duration.count() << "s");

    return grant;
}

std::chrono::seconds HttpEventingClient::renew(const QUrl &eventUrl,
                                               const QString &sid,
                                               std::chrono::seconds duration) {
    HttpClient::Request request;
    request.url = eventUrl;
    request.verb = QByteArrayLiteral("SUBSCRIBE");
    request.timeout = m_timeout;
    request.headers = {{QByteArrayLiteral("SID"), sid.toUtf8()},
                       {QByteArrayLiteral("TIMEOUT"), timeoutHeader(duration)}};

    HttpClient::Response response;
    try {
        response = HttpClient::send(request);
    } catch (const TransportError &e) {
        throw RenewError{sid, RenewError::Reason::Transport,
                         std::string{"renew transport error: "} + e.what()};
    }

    if (!response.ok())
        throw RenewError{sid, RenewError::Reason::Rejected,
                         "renew rejected with status " +
                             std::to_string(response.status)};

    return parseTimeout(response.header("TIMEOUT"), duration)
        .value_or(duration);
}

void HttpEventingClient::unsubscribe(const QUrl &eventUrl, const QString &sid) {
    HttpClient::Request request;
    request.url = eventUrl;
    request.verb = QByteArrayLiteral("UNSUBSCRIBE");
    request.timeout = m_timeout;
    request.headers = {{QByteArrayLiteral("SID"), sid.toUtf8()}};

    auto response = HttpClient::send(request);
    if (!response.ok())
        throw TransportError{"unsubscribe failed with status " +
                             std::to_string(response.status)};
}
