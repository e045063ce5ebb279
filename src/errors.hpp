/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef ERRORS_H
#define ERRORS_H

#include <QString>
#include <stdexcept>
#include <string>

// Connection, DNS or timeout failure at the socket layer.
class TransportError : public std::runtime_error {
   public:
    explicit TransportError(const std::string &what)
        : std::runtime_error{what} {}
};

class MalformedDescription : public std::runtime_error {
   public:
    explicit MalformedDescription(const std::string &what)
        : std::runtime_error{what} {}
};

class MalformedEvent : public std::runtime_error {
   public:
    explicit MalformedEvent(const std::string &what)
        : std::runtime_error{what} {}
};

// Device-reported logical error carried in a SOAP fault envelope.
class ControlFault : public std::runtime_error {
   public:
    ControlFault(int code, const QString &description)
        : std::runtime_error{"control fault " + std::to_string(code) + ": " +
                             description.toStdString()},
          m_code{code},
          m_description{description} {}
    inline auto code() const { return m_code; }
    inline const auto &description() const { return m_description; }

   private:
    int m_code = 0;
    QString m_description;
};

class SubscribeError : public std::runtime_error {
   public:
    explicit SubscribeError(const std::string &what)
        : std::runtime_error{what} {}
};

class RenewError : public std::runtime_error {
   public:
    enum class Reason {
        // id not present in the registry, no request was sent
        UnknownSubscription,
        // device answered with an error status (usually 412)
        Rejected,
        Transport
    };

    RenewError(const QString &sid, Reason reason, const std::string &what)
        : std::runtime_error{what}, m_sid{sid}, m_reason{reason} {}
    inline const auto &sid() const { return m_sid; }
    inline auto reason() const { return m_reason; }

   private:
    QString m_sid;
    Reason m_reason;
};

#endif  // ERRORS_H
