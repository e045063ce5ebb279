/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "settings.h"

#include <QCoreApplication>
#include <QDir>
#include <QStandardPaths>

#include "description.h"
#include "httpclient.h"
#include "qtlogger.hpp"

QString Settings::settingsFilepath() {
    QDir confDir{
        QStandardPaths::writableLocation(QStandardPaths::ConfigLocation)};
    confDir.mkpath(QCoreApplication::applicationName());
    return confDir.absolutePath() + QDir::separator() +
           QCoreApplication::applicationName() + QDir::separator() +
           settingsFilename;
}

Settings::Settings() : Settings{settingsFilepath()} {}

Settings::Settings(const QString &file) : QSettings{file, QSettings::IniFormat} {}

void Settings::initLogger(WemoLogger::LogType level) const {
    WemoLogger::init(level,
                     getLogToFile()
                         ? QDir{QStandardPaths::writableLocation(
                                    QStandardPaths::CacheLocation)}
                               .filePath(QStringLiteral("wemoctl.log"))
                               .toStdString()
                         : std::string{});

    initQtLogger();
}

int Settings::getDiscoveryTimeout() const {
    return value(QStringLiteral("discoverytimeout"), 5000).toInt();
}

QString Settings::getSearchTarget() const {
    return value(QStringLiteral("searchtarget"),
                 QString::fromLatin1(
                     DescriptionParser::basicEventServiceType))
        .toString();
}

int Settings::getControlTimeout() const {
    return value(QStringLiteral("controltimeout"), HttpClient::defaultTimeout)
        .toInt();
}

int Settings::getSubscriptionDuration() const {
    return value(QStringLiteral("subscriptionduration"), 300).toInt();
}

QString Settings::getListenerAddress() const {
    return value(QStringLiteral("listeneraddress"), QString{}).toString();
}

int Settings::getListenerPort() const {
    return value(QStringLiteral("listenerport"), 0).toInt();
}

QString Settings::getListenerPathPrefix() const {
    return value(QStringLiteral("listenerpathprefix"), QStringLiteral("/wemo"))
        .toString();
}

QString Settings::getPrefNetInf() const {
    return value(QStringLiteral("prefnetinf"), QString{}).toString();
}

QString Settings::getAdvertiseAddress() const {
    return value(QStringLiteral("advertiseaddress"), QString{}).toString();
}

bool Settings::getLogToFile() const {
    return value(QStringLiteral("logtofile"), false).toBool();
}
