/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef SETTINGS_H
#define SETTINGS_H

#include <QSettings>
#include <QString>

#include "logger.hpp"
#include "singleton.h"

class Settings : public QSettings, public Singleton<Settings> {
   public:
    static constexpr const char *settingsFilename = "settings.ini";

    Settings();
    explicit Settings(const QString &file);

    void initLogger(WemoLogger::LogType level) const;

    int getDiscoveryTimeout() const;
    QString getSearchTarget() const;
    int getControlTimeout() const;
    int getSubscriptionDuration() const;
    QString getListenerAddress() const;
    int getListenerPort() const;
    QString getListenerPathPrefix() const;
    QString getPrefNetInf() const;
    QString getAdvertiseAddress() const;
    bool getLogToFile() const;

   private:
    static QString settingsFilepath();
};

#endif  // SETTINGS_H
