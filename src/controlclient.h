/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef CONTROLCLIENT_H
#define CONTROLCLIENT_H

#include <QByteArray>
#include <QString>
#include <optional>
#include <utility>
#include <vector>

#include "device.h"
#include "httpclient.h"

struct ControlCommand {
    using Arg = std::pair<QString, QString>;

    QString serviceType;
    QString action;
    std::vector<Arg> args;
};

class ControlResult {
   public:
    using Field = std::pair<QString, QString>;

    void add(QString name, QString value);
    std::optional<QString> value(const QString &name) const;
    inline const auto &fields() const { return m_fields; }
    inline auto size() const { return m_fields.size(); }
    inline auto empty() const { return m_fields.empty(); }

   private:
    std::vector<Field> m_fields;
};

class ControlClient {
   public:
    explicit ControlClient(int timeout = HttpClient::defaultTimeout);

    /**
     * Invokes action on device's control URL.
     *
     * When command has empty service type, device's service type is used.
     * Throws ControlFault when device responds with SOAP fault,
     * TransportError on connection failure, timeout or unexpected HTTP
     * status.
     */
    ControlResult send(const Device &device,
                       const ControlCommand &command) const;

    static QByteArray makeEnvelope(const QString &serviceType,
                                   const ControlCommand &command);
    static QByteArray soapAction(const QString &serviceType,
                                 const QString &action);
    static ControlResult decodeResponse(int status, const QByteArray &body,
                                        const QString &action);

   private:
    int m_timeout;
};

#endif  // CONTROLCLIENT_H
