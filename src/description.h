/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef DESCRIPTION_H
#define DESCRIPTION_H

#include <QByteArray>
#include <QString>
#include <QUrl>

#include "device.h"

namespace DescriptionParser {
static const auto basicEventServiceType = "urn:Belkin:service:basicevent:1";

/**
 * Parses device description document (setup.xml).
 *
 * Relative URLs are resolved against URLBase element when it is present,
 * otherwise against sourceUrl. Throws MalformedDescription when document
 * is not valid XML or when UDN, control URL or event URL is missing.
 */
Device parse(const QByteArray &data, const QUrl &sourceUrl);
}  // namespace DescriptionParser

#endif  // DESCRIPTION_H
