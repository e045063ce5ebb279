/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef EVENT_H
#define EVENT_H

#include <QByteArray>
#include <QDebug>
#include <QString>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

struct Event {
    using Var = std::pair<QString, QString>;

    QString sid;
    std::vector<Var> vars;

    std::optional<QString> value(const QString &name) const;

    bool operator==(const Event &other) const;
    inline bool operator!=(const Event &other) const {
        return !(*this == other);
    }
    friend QDebug operator<<(QDebug dbg, const Event &event);
};

struct EventHandler {
    std::function<void(const Event &)> onEvent;
    // Called once when subscription cannot be renewed nor re-established.
    std::function<void(const QString &sid)> onSubscriptionLost;
};

namespace EventParser {
/**
 * Parses NOTIFY body (e:propertyset) into event tagged with sid.
 *
 * Throws MalformedEvent when body is not valid XML, root element is not
 * a property set or set carries no properties.
 */
Event parse(const QByteArray &body, const QString &sid);
}  // namespace EventParser

#endif  // EVENT_H
