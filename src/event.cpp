/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "event.h"

#include <QDomDocument>
#include <QDomElement>

#include "errors.hpp"

std::optional<QString> Event::value(const QString &name) const {
    for (const auto &[key, value] : vars) {
        if (key == name) return value;
    }
    return std::nullopt;
}

bool Event::operator==(const Event &other) const {
    return sid == other.sid && vars == other.vars;
}

QDebug operator<<(QDebug dbg, const Event &event) {
    QDebugStateSaver saver{dbg};
    dbg.nospace() << "Event(sid=" << event.sid;
    for (const auto &[key, value] : event.vars)
        dbg << ", " << key << "=" << value;
    dbg << ")";
    return dbg;
}

namespace EventParser {

static QString localName(const QDomElement &e) {
    return e.localName().isEmpty() ? e.tagName() : e.localName();
}

Event parse(const QByteArray &body, const QString &sid) {
    QDomDocument doc;
    QString error;
    if (!doc.setContent(body, true, &error))
        throw MalformedEvent{"event parse error: " + error.toStdString()};

    const auto root = doc.documentElement();
    if (localName(root) != QStringLiteral("propertyset"))
        throw MalformedEvent{"event root is not propertyset: " +
                             root.tagName().toStdString()};

    Event event;
    event.sid = sid;

    for (auto p = root.firstChildElement(); !p.isNull();
         p = p.nextSiblingElement()) {
        if (localName(p) != QStringLiteral("property")) continue;
        for (auto v = p.firstChildElement(); !v.isNull();
             v = v.nextSiblingElement()) {
            event.vars.emplace_back(localName(v), v.text());
        }
    }

    if (event.vars.empty()) throw MalformedEvent{"event has no properties"};

    return event;
}

}  // namespace EventParser
