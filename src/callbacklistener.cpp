/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "callbacklistener.h"

#include <qhttprequest.h>
#include <qhttpresponse.h>
#include <qhttpserver.h>

#include <QTcpServer>

#include "connectivitydetector.h"
#include "errors.hpp"
#include "event.h"
#include "logger.hpp"

CallbackListener::CallbackListener(
    std::shared_ptr<SubscriptionRegistry> registry, Config config,
    QObject *parent)
    : QThread{parent},
      m_registry{std::move(registry)},
      m_config{std::move(config)},
      m_executor{m_config.workerCount} {
    m_config.pathPrefix = normalizePrefix(m_config.pathPrefix);
}

CallbackListener::~CallbackListener() { stopListening(); }

QString CallbackListener::normalizePrefix(const QString &prefix) {
    auto p = prefix.trimmed();
    while (p.endsWith('/')) p.chop(1);
    if (!p.isEmpty() && !p.startsWith('/')) p.prepend('/');
    return p;
}

std::optional<QString> CallbackListener::segmentFromPath(
    const QString &prefix, const QString &path) {
    const auto start = prefix + '/';
    if (!path.startsWith(start)) return std::nullopt;

    auto segment = path.mid(start.size());
    if (segment.isEmpty() || segment.contains('/')) return std::nullopt;

    return segment;
}

quint16 CallbackListener::findFreePort(const QHostAddress &address) {
    QTcpServer probe;
    if (!probe.listen(address, 0))
        throw TransportError{"cannot find free port: " +
                             probe.errorString().toStdString()};
    const auto port = probe.serverPort();
    probe.close();
    return port;
}

void CallbackListener::dispatch(const QString &segment,
                                std::function<void()> job) {
    bool startDrain = false;
    {
        std::lock_guard lock{m_dispatchMtx};
        auto &queue = m_queues[segment];
        queue.jobs.push_back(std::move(job));
        if (!queue.draining) {
            queue.draining = true;
            startDrain = true;
        }
    }

    if (startDrain) m_executor.startTask([this, segment] { drain(segment); });
}

void CallbackListener::drain(const QString &segment) {
    while (true) {
        std::function<void()> job;
        {
            std::lock_guard lock{m_dispatchMtx};
            auto it = m_queues.find(segment);
            if (it == m_queues.end()) return;
            if (it->second.jobs.empty()) {
                m_queues.erase(it);
                return;
            }
            job = std::move(it->second.jobs.front());
            it->second.jobs.pop_front();
        }

        try {
            job();
        } catch (const std::exception &e) {
            LOGE("event handler error: " << e.what());
        }
    }
}

QString CallbackListener::resolveAdvertiseAddress() const {
    if (!m_config.advertiseAddress.isEmpty()) return m_config.advertiseAddress;

    if (m_config.address != QHostAddress::Any &&
        m_config.address != QHostAddress::AnyIPv4 &&
        m_config.address != QHostAddress::AnyIPv6)
        return m_config.address.toString();

    auto *detector = ConnectivityDetector::instance();
    detector->update();

    QString ifname, address;
    if (!detector->selectNetworkIf(ifname, address))
        throw TransportError{"no network interface to advertise"};

    LOGD("advertised interface: " << ifname << " " << address);

    return address;
}

void CallbackListener::startListening() {
    if (isRunning()) return;

    m_advertiseAddress = resolveAdvertiseAddress();

    m_ready = std::promise<quint16>{};
    auto ready = m_ready.get_future();

    start(QThread::NormalPriority);

    try {
        m_port = ready.get();
    } catch (const TransportError &e) {
        LOGE("callback listener failed to start: " << e.what());
        wait();
        throw;
    }

    LOGI("callback listener started: " << callbackBaseUrl());
}

void CallbackListener::stopListening() {
    if (!isRunning()) return;

    quit();
    wait();

    if (!m_executor.waitForDone(HttpClient::defaultTimeout))
        LOGW("event handlers still running after listener stop");

    m_port = 0;

    LOGI("callback listener stopped");
}

QUrl CallbackListener::callbackBaseUrl() const {
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(m_advertiseAddress);
    url.setPort(m_port);
    url.setPath(m_config.pathPrefix);
    return url;
}

void CallbackListener::run() {
    auto server = std::make_unique<QHttpServer>();

    connect(server.get(), &QHttpServer::newRequest, server.get(),
            [this](QHttpRequest *req, QHttpResponse *resp) {
                requestHandler(req, resp);
            });

    try {
        auto port = m_config.port == 0 ? findFreePort(m_config.address)
                                       : m_config.port;

        if (!server->listen(m_config.address, port))
            throw TransportError{"unable to start http server on port " +
                                 std::to_string(port)};

        m_ready.set_value(port);
    } catch (const TransportError &) {
        m_ready.set_exception(std::current_exception());
        return;
    }

    QThread::exec();

    server->close();
}

void CallbackListener::sendEmptyResponse(QHttpResponse *resp, int code) {
    LOGT("send empty response: " << code);
    resp->setHeader(QStringLiteral("Content-Length"), QStringLiteral("0"));
    resp->setHeader(QStringLiteral("Connection"), QStringLiteral("close"));
    resp->writeHead(code);
    resp->end();
}

void CallbackListener::requestHandler(QHttpRequest *req, QHttpResponse *resp) {
    LOGD("request: " << req->methodString() << " " << req->url().path());

    if (req->methodString() != QStringLiteral("NOTIFY")) {
        LOGW("request method is unsupported: " << req->methodString());
        resp->setHeader(QStringLiteral("Allow"), QStringLiteral("NOTIFY"));
        sendEmptyResponse(resp, 405);
        return;
    }

    req->storeBody();
    connect(req, &QHttpRequest::end, req,
            [this, req, resp] { notifyHandler(req, resp); });
}

void CallbackListener::notifyHandler(QHttpRequest *req, QHttpResponse *resp) {
    const auto segment =
        segmentFromPath(m_config.pathPrefix, req->url().path());
    std::optional<SubscriptionRegistry::Route> route;
    if (segment) route = m_registry->route(*segment);
    if (!route) {
        LOGW("notify for unknown path: " << req->url().path());
        sendEmptyResponse(resp, 404);
        return;
    }

    // route is reserved but subscribe response has not arrived yet
    const auto sid = route->sid.isEmpty()
                         ? req->header(QStringLiteral("sid")).trimmed()
                         : route->sid;
    if (sid.isEmpty()) {
        LOGW("notify without sid for pending subscription: " << *segment);
        sendEmptyResponse(resp, 400);
        return;
    }

    try {
        auto event = EventParser::parse(req->body(), sid);
        LOGD("event received: " << sid << " vars: " << event.vars.size());
        dispatch(*segment, [handler = std::move(route->handler),
                            event = std::move(event)] {
            handler.onEvent(event);
        });
    } catch (const MalformedEvent &e) {
        LOGW("malformed event: " << sid << " " << e.what());
        sendEmptyResponse(resp, 400);
        return;
    }

    sendEmptyResponse(resp, 200);
}
