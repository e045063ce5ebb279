/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef CALLBACKLISTENER_H
#define CALLBACKLISTENER_H

#include <QByteArray>
#include <QHostAddress>
#include <QString>
#include <QThread>
#include <QUrl>
#include <atomic>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "subscriptionregistry.h"
#include "taskexecutor.h"

class QHttpRequest;
class QHttpResponse;

/**
 * HTTP endpoint receiving NOTIFY requests from devices.
 *
 * Server lives in listener's own thread. Path segment after prefix is the
 * correlation key registered in SubscriptionRegistry. Handlers run on
 * worker pool. Events of one subscription are delivered one at a time in
 * arrival order, different subscriptions are delivered in parallel.
 */
class CallbackListener : public QThread {
   public:
    struct Config {
        QHostAddress address{QHostAddress::AnyIPv4};
        quint16 port = 0;  // 0 => ephemeral
        QString pathPrefix = QStringLiteral("/wemo");
        // address put in callback URLs, detected when empty
        QString advertiseAddress;
        int workerCount = 4;
    };

    CallbackListener(std::shared_ptr<SubscriptionRegistry> registry,
                     Config config, QObject *parent = nullptr);
    ~CallbackListener() override;

    // Blocks until server is bound. Throws TransportError.
    void startListening();
    void stopListening();
    inline bool listening() const { return m_port != 0; }
    inline quint16 port() const { return m_port; }
    QUrl callbackBaseUrl() const;

    static QString normalizePrefix(const QString &prefix);
    static std::optional<QString> segmentFromPath(const QString &prefix,
                                                  const QString &path);

   private:
    std::shared_ptr<SubscriptionRegistry> m_registry;
    Config m_config;
    QString m_advertiseAddress;
    std::atomic<quint16> m_port{0};
    std::promise<quint16> m_ready;
    TaskExecutor m_executor;

    struct DispatchQueue {
        std::deque<std::function<void()>> jobs;
        bool draining = false;
    };
    std::mutex m_dispatchMtx;
    // keyed by callback path segment
    std::map<QString, DispatchQueue> m_queues;

    void run() override;
    void requestHandler(QHttpRequest *req, QHttpResponse *resp);
    void notifyHandler(QHttpRequest *req, QHttpResponse *resp);
    void dispatch(const QString &segment, std::function<void()> job);
    void drain(const QString &segment);
    QString resolveAdvertiseAddress() const;
    static quint16 findFreePort(const QHostAddress &address);
    static void sendEmptyResponse(QHttpResponse *resp, int code);
};

#endif  // CALLBACKLISTENER_H
