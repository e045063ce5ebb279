/* Copyright (C) 2021-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "httpclient.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <memory>

#include "errors.hpp"
#include "logger.hpp"

static const QByteArray userAgent =
    QByteArrayLiteral("Linux/5.x UPnP/1.0 wemoctl/1.0");

QByteArray HttpClient::Response::header(const QByteArray &name) const {
    for (const auto &[key, value] : headers) {
        if (qstricmp(key.constData(), name.constData()) == 0) return value;
    }
    return {};
}

HttpClient::Response HttpClient::get(const QUrl &url, int timeout) {
    Request request;
    request.url = url;
    request.timeout = timeout;
    return send(request);
}

HttpClient::Response HttpClient::send(const Request &request) {
    LOGD("http " << request.verb << " " << request.url);

    QNetworkRequest netRequest{request.url};
    netRequest.setRawHeader(QByteArrayLiteral("User-Agent"), userAgent);
    netRequest.setRawHeader(QByteArrayLiteral("Connection"),
                            QByteArrayLiteral("close"));
    for (const auto &[key, value] : request.headers)
        netRequest.setRawHeader(key, value);

    QNetworkAccessManager nam;
    nam.setProxy(QNetworkProxy::NoProxy);

    std::unique_ptr<QNetworkReply> reply{
        nam.sendCustomRequest(netRequest, request.verb, request.body)};

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    timer.setInterval(request.timeout);

    bool timedOut = false;
    QObject::connect(&timer, &QTimer::timeout, &loop,
                     [&reply, &timedOut] {
                         timedOut = true;
                         reply->abort();
                     });
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop,
                     &QEventLoop::quit);

    if (!reply->isFinished()) {
        timer.start();
        loop.exec();
        timer.stop();
    }

    if (timedOut) {
        LOGW("http timeout: " << request.url);
        throw TransportError{"request timeout: " +
                             request.url.toString().toStdString()};
    }

    Response response;

    auto status =
        reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!status.isValid()) {
        LOGW("http error: " << reply->errorString() << " " << request.url);
        throw TransportError{reply->errorString().toStdString()};
    }

    response.status = status.toInt();
    for (const auto &pair : reply->rawHeaderPairs())
        response.headers.emplace_back(pair.first, pair.second);
    response.body = reply->readAll();

    LOGD("http response: " << response.status << " " << request.url);

    return response;
}
