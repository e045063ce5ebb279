/* Copyright (C) 2023-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "qtlogger.hpp"

#include <QMessageLogContext>
#include <QString>
#include <QtGlobal>
#include <cstring>

#include "logger.hpp"

static WemoLogger::LogType logType(QtMsgType qtType, const char *category) {
    // network and xml modules report routine socket state as warnings
    if (category != nullptr && (std::strncmp(category, "qt.network", 10) == 0 ||
                                std::strncmp(category, "qt.xml", 6) == 0))
        return WemoLogger::LogType::Trace;

    switch (qtType) {
        case QtDebugMsg:
            return WemoLogger::LogType::Debug;
        case QtInfoMsg:
            return WemoLogger::LogType::Info;
        case QtWarningMsg:
            return WemoLogger::LogType::Warning;
        case QtCriticalMsg:
        case QtFatalMsg:
            return WemoLogger::LogType::Error;
    }

    return WemoLogger::LogType::Debug;
}

static void qtLog(QtMsgType qtType, const QMessageLogContext &qtContext,
                  const QString &qtMsg) {
    const auto type = logType(qtType, qtContext.category);
    if (!WemoLogger::match(type)) return;

    WemoLogger::Message msg{type, qtContext.file ? qtContext.file : "",
                            qtContext.function ? qtContext.function : "",
                            qtContext.line};

    if (qtContext.category != nullptr &&
        std::strcmp(qtContext.category, "default") != 0)
        msg << '[' << qtContext.category << "] ";

    msg << qtMsg;
}

void initQtLogger() { qInstallMessageHandler(qtLog); }
