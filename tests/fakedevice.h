/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef FAKEDEVICE_H
#define FAKEDEVICE_H

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QThread>
#include <QUrl>
#include <functional>
#include <future>
#include <mutex>
#include <utility>
#include <vector>

class QHttpRequest;
class QHttpResponse;

// HTTP server on loopback answering with handler's replies.
class FakeDevice : public QThread {
   public:
    struct Request {
        QString method;
        QString path;
        QHash<QString, QString> headers;  // lower case names
        QByteArray body;
    };

    struct Reply {
        int status = 200;
        std::vector<std::pair<QString, QString>> headers;
        QByteArray body;
    };

    using Handler = std::function<Reply(const Request &)>;

    explicit FakeDevice(Handler handler);
    ~FakeDevice() override;

    inline auto port() const { return m_port; }
    QUrl url(const QString &path) const;
    std::vector<Request> requests() const;

    static QByteArray setupXml(const QString &udn,
                               const QString &serial = QStringLiteral("SN1"),
                               const QString &name = QStringLiteral("Lamp"));
    static QByteArray soapResponse(const QString &action, const QString &name,
                                   const QString &value);
    static QByteArray soapFault(int code, const QString &description);

   private:
    Handler m_handler;
    quint16 m_port = 0;
    std::promise<quint16> m_ready;
    mutable std::mutex m_mtx;
    std::vector<Request> m_requests;

    void run() override;
    void handle(QHttpRequest *req, QHttpResponse *resp);
};

#endif  // FAKEDEVICE_H
