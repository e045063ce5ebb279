/* Copyright (C) 2022-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "logger.hpp"

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <threads.h>

#include <QByteArray>
#include <QString>
#include <QUrl>
#include <chrono>
#include <cstdio>

WemoLogger::LogType WemoLogger::m_level = WemoLogger::LogType::Error;
std::optional<std::ofstream> WemoLogger::m_file = std::nullopt;
std::mutex WemoLogger::m_mtx;

std::ostream &operator<<(std::ostream &os, const QString &str) {
    os << str.toStdString();
    return os;
}

std::ostream &operator<<(std::ostream &os, const QByteArray &data) {
    os << data.toStdString();
    return os;
}

std::ostream &operator<<(std::ostream &os, const QUrl &url) {
    os << url.toString().toStdString();
    return os;
}

std::ostream &operator<<(std::ostream &os, WemoLogger::LogType type) {
    switch (type) {
        case WemoLogger::LogType::Trace:
            os << "trace";
            break;
        case WemoLogger::LogType::Debug:
            os << "debug";
            break;
        case WemoLogger::LogType::Info:
            os << "info";
            break;
        case WemoLogger::LogType::Warning:
            os << "warning";
            break;
        case WemoLogger::LogType::Error:
            os << "error";
            break;
        case WemoLogger::LogType::Quiet:
            os << "quiet";
            break;
    }
    return os;
}

void WemoLogger::init(LogType level, const std::string &file) {
    m_level = level;

    setFile(file);
}

void WemoLogger::setLevel(LogType level) {
    if (m_level != level) {
        auto old = m_level;
        m_level = level;
        LOGD("logging level changed: " << old << " => " << m_level);
    }
}

void WemoLogger::setFile(const std::string &file) {
    {
        std::lock_guard lock{m_mtx};
        if (file.empty()) {
            m_file.reset();
        } else {
            m_file.emplace(file, std::ios::app);
            if (!m_file->good()) m_file.reset();
        }
    }

    if (file.empty()) {
        LOGI("logging to stderr enabled");
    } else if (m_file) {
        LOGI("logging to file enabled: " << file);
    } else {
        LOGW("failed to create log file: " << file);
    }
}

WemoLogger::LogType WemoLogger::level() { return m_level; }

bool WemoLogger::match(LogType type) {
    return static_cast<int>(type) >= static_cast<int>(m_level);
}

WemoLogger::Message::Message(LogType type, const char *file,
                             const char *function, int line)
    : m_type{type}, m_file{file}, m_fun{function}, m_line{line} {}

inline static auto typeToChar(WemoLogger::LogType type) {
    switch (type) {
        case WemoLogger::LogType::Trace:
            return 'T';
        case WemoLogger::LogType::Debug:
            return 'D';
        case WemoLogger::LogType::Info:
            return 'I';
        case WemoLogger::LogType::Warning:
            return 'W';
        case WemoLogger::LogType::Error:
            return 'E';
        case WemoLogger::LogType::Quiet:
            return 'Q';
    }
    return '-';
}

WemoLogger::Message::~Message() {
    if (!match(m_type)) return;

    auto now = std::chrono::system_clock::now();
    auto msecs = std::chrono::duration_cast<std::chrono::milliseconds>(
                     now.time_since_epoch())
                     .count() %
                 1000;

    const auto str = m_os.str();
    if (str.empty()) return;

    if (m_fun == nullptr || m_fun[0] == '\0') m_fun = m_emptyStr;

    auto pattern = fmt::format(
        "[{{0}}] {{1:%H:%M:%S}}.{{2:03}} {{3:#10x}} {{4}}{}- {{5}}{}",
        m_line > 0 ? ":{6} " : " ", str.back() == '\n' ? "" : "\n");
    try {
        auto line =
            fmt::format(fmt::runtime(pattern), typeToChar(m_type), now, msecs,
                        thrd_current(), m_fun, str, m_line);
        std::lock_guard lock{m_mtx};
        if (WemoLogger::m_file) {
            *WemoLogger::m_file << line;
            WemoLogger::m_file->flush();
        } else {
            fmt::print(stderr, "{}", line);
            fflush(stderr);
        }
    } catch (const std::runtime_error &e) {
        fmt::print(stderr, "logger error: {}\n", e.what());
        fmt::print(stderr, "{}\n", str);
    }
}
