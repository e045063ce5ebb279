/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <fmt/core.h>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <atomic>
#include <chrono>
#include <csignal>
#include <optional>
#include <sstream>
#include <vector>

#include "binaryswitch.h"
#include "connectivitydetector.h"
#include "device.h"
#include "discovery.h"
#include "errors.hpp"
#include "logger.hpp"
#include "qtlogger.hpp"
#include "settings.h"
#include "subscriptions.h"

static std::atomic_bool quitRequested{false};

static void signalHandler(int sig) {
    static_cast<void>(sig);
    quitRequested = true;
}

struct CmdOptions {
    bool valid = true;
    bool verbose = false;
    QString log_file;
    QString command;
    QStringList targets;
    std::optional<std::chrono::milliseconds> retry;
    std::optional<int> timeout;
    std::optional<int> port;
    std::optional<int> duration;
    QString search_target;
    QString address;
    QString advertise;
    QString interface;
};

static CmdOptions checkOptions(const QCoreApplication& app) {
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Discovers and controls WeMo switches."));

    QCommandLineOption verbose_opt{QStringLiteral("verbose"),
                                   QStringLiteral("Enables debug output.")};
    parser.addOption(verbose_opt);

    QCommandLineOption log_file_opt{
        QStringLiteral("log-file"),
        QStringLiteral("Write logs to <log-file> instead of stderr."),
        QStringLiteral("log-file")};
    parser.addOption(log_file_opt);

    QCommandLineOption timeout_opt{
        QStringLiteral("timeout"),
        QStringLiteral("Discovery timeout in milliseconds."),
        QStringLiteral("ms")};
    parser.addOption(timeout_opt);

    QCommandLineOption retry_opt{
        QStringLiteral("retry"),
        QStringLiteral("Retry control command on network error for <ms>."),
        QStringLiteral("ms")};
    parser.addOption(retry_opt);

    QCommandLineOption search_target_opt{
        QStringLiteral("search-target"),
        QStringLiteral("SSDP search target."), QStringLiteral("st")};
    parser.addOption(search_target_opt);

    QCommandLineOption address_opt{
        QStringLiteral("address"),
        QStringLiteral("Address of event listener."),
        QStringLiteral("address")};
    parser.addOption(address_opt);

    QCommandLineOption port_opt{QStringLiteral("port"),
                                QStringLiteral("Port of event listener."),
                                QStringLiteral("port")};
    parser.addOption(port_opt);

    QCommandLineOption advertise_opt{
        QStringLiteral("advertise"),
        QStringLiteral("Address put in callback URLs."),
        QStringLiteral("address")};
    parser.addOption(advertise_opt);

    QCommandLineOption interface_opt{
        QStringLiteral("interface"),
        QStringLiteral("Preferred network interface."),
        QStringLiteral("ifname")};
    parser.addOption(interface_opt);

    QCommandLineOption duration_opt{
        QStringLiteral("duration"),
        QStringLiteral("Requested subscription duration in seconds."),
        QStringLiteral("seconds")};
    parser.addOption(duration_opt);

    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("discover, state, on, off, toggle, name or listen."));
    parser.addPositionalArgument(
        QStringLiteral("targets"),
        QStringLiteral("Serial numbers or host[:port] of devices."),
        QStringLiteral("[targets...]"));

    parser.addHelpOption();
    parser.addVersionOption();

    parser.process(app);

    CmdOptions options;
    options.log_file = parser.value(log_file_opt);
    options.verbose = parser.isSet(verbose_opt);

    auto intValue = [&](const QCommandLineOption& opt,
                        const auto& setter) {
        if (!parser.isSet(opt)) return;
        bool ok = false;
        auto value = parser.value(opt).toInt(&ok);
        if (ok && value >= 0) {
            setter(value);
        } else {
            fmt::print(stderr, "invalid value of --{}: {}\n",
                       opt.names().first().toStdString(),
                       parser.value(opt).toStdString());
            options.valid = false;
        }
    };

    intValue(timeout_opt, [&](int v) { options.timeout = v; });
    intValue(port_opt, [&](int v) { options.port = v; });
    intValue(duration_opt, [&](int v) { options.duration = v; });
    intValue(retry_opt,
             [&](int v) { options.retry = std::chrono::milliseconds{v}; });

    options.search_target = parser.value(search_target_opt);
    options.address = parser.value(address_opt);
    options.advertise = parser.value(advertise_opt);
    options.interface = parser.value(interface_opt);

    auto args = parser.positionalArguments();
    if (args.isEmpty()) {
        fmt::print(stderr, "{}", parser.helpText().toStdString());
        options.valid = false;
        return options;
    }

    options.command = args.takeFirst();
    options.targets = args;

    return options;
}

static std::string toString(const Device& device) {
    std::ostringstream os;
    os << device;
    return os.str();
}

static std::string toString(BinaryState state) {
    std::ostringstream os;
    os << state;
    return os.str();
}

static DiscoveryClient makeDiscoveryClient(const CmdOptions& options,
                                           const Settings* settings) {
    DiscoveryClient::Config config;
    config.searchTarget = options.search_target.isEmpty()
                              ? settings->getSearchTarget()
                              : options.search_target;
    return DiscoveryClient{config};
}

static std::chrono::milliseconds discoveryTimeout(const CmdOptions& options,
                                                  const Settings* settings) {
    return std::chrono::milliseconds{
        options.timeout.value_or(settings->getDiscoveryTimeout())};
}

// Target is serial number or host[:port].
static std::optional<Device> findDevice(const QString& target,
                                        const CmdOptions& options,
                                        const Settings* settings) {
    if (!target.contains('.') && !target.contains(':'))
        return makeDiscoveryClient(options, settings)
            .findBySerial(target, discoveryTimeout(options, settings));

    const auto host = target.section(':', 0, 0);
    bool ok = false;
    const auto port = target.section(':', 1, 1).toUShort(&ok);
    if (!ok) return DiscoveryClient::probe(host);

    return DiscoveryClient::probe(host, {port});
}

static std::vector<Device> findDevices(const CmdOptions& options,
                                       const Settings* settings) {
    if (options.targets.isEmpty())
        return makeDiscoveryClient(options, settings)
            .discover(discoveryTimeout(options, settings));

    std::vector<Device> devices;
    for (const auto& target : options.targets) {
        if (auto device = findDevice(target, options, settings)) {
            devices.push_back(std::move(*device));
        } else {
            fmt::print(stderr, "device not found: {}\n", target.toStdString());
        }
    }
    return devices;
}

static int discoverCommand(const CmdOptions& options,
                           const Settings* settings) {
    auto devices = findDevices(options, settings);
    for (const auto& device : devices) {
        fmt::print("{}\t{}\t{}\t{}\n", device.serialNumber.toStdString(),
                   device.friendlyName.toStdString(),
                   device.location.toString().toStdString(),
                   device.udn.toStdString());
    }
    return 0;
}

static int switchCommand(const CmdOptions& options, const Settings* settings) {
    if (options.targets.isEmpty()) {
        fmt::print(stderr, "no target device\n");
        return 2;
    }

    const ControlClient client{settings->getControlTimeout()};
    const auto devices = findDevices(options, settings);

    for (const auto& device : devices) {
        BinarySwitch sw{device, client};

        if (options.command == QStringLiteral("name")) {
            fmt::print("{}\t{}\n", device.serialNumber.toStdString(),
                       sw.friendlyName().toStdString());
            continue;
        }

        BinaryState state;
        if (options.command == QStringLiteral("state")) {
            state = options.retry ? sw.stateWithRetry(*options.retry)
                                  : sw.state();
        } else if (options.command == QStringLiteral("on")) {
            state = options.retry ? sw.turnOnWithRetry(*options.retry)
                                  : sw.turnOn();
        } else if (options.command == QStringLiteral("off")) {
            state = options.retry ? sw.turnOffWithRetry(*options.retry)
                                  : sw.turnOff();
        } else {
            state = sw.toggle();
        }

        fmt::print("{}\t{}\n", device.serialNumber.toStdString(),
                   toString(state));
    }

    return devices.size() == static_cast<size_t>(options.targets.size()) ? 0
                                                                          : 1;
}

static int listenCommand(const QCoreApplication& app, const CmdOptions& options,
                         const Settings* settings) {
    Subscriptions::Config config;
    config.duration = std::chrono::seconds{
        options.duration.value_or(settings->getSubscriptionDuration())};
    config.listener.port = static_cast<quint16>(
        options.port.value_or(settings->getListenerPort()));
    config.listener.pathPrefix = settings->getListenerPathPrefix();
    config.listener.advertiseAddress = options.advertise.isEmpty()
                                           ? settings->getAdvertiseAddress()
                                           : options.advertise;
    auto address = options.address.isEmpty() ? settings->getListenerAddress()
                                             : options.address;
    if (!address.isEmpty()) config.listener.address = QHostAddress{address};

    ConnectivityDetector::instance()->setPreferredNetworkIf(
        options.interface.isEmpty() ? settings->getPrefNetInf()
                                    : options.interface);

    auto devices = findDevices(options, settings);
    if (devices.empty()) {
        fmt::print(stderr, "no devices\n");
        return 1;
    }

    Subscriptions subscriptions{config};
    subscriptions.start();

    fmt::print(stderr, "listening on {}\n",
               subscriptions.callbackBaseUrl().toString().toStdString());

    for (const auto& device : devices) {
        EventHandler handler;
        handler.onEvent = [name = device.friendlyName](const Event& event) {
            for (const auto& [var, value] : event.vars) {
                fmt::print("{}\t{}\t{}\n", name.toStdString(),
                           var.toStdString(), value.toStdString());
            }
            fflush(stdout);
        };
        handler.onSubscriptionLost = [name = device.friendlyName](
                                         const QString& sid) {
            fmt::print(stderr, "subscription lost: {} {}\n",
                       name.toStdString(), sid.toStdString());
        };

        try {
            subscriptions.subscribe(device, std::move(handler));
        } catch (const SubscribeError& e) {
            fmt::print(stderr, "cannot subscribe {}: {}\n", toString(device),
                       e.what());
        }
    }

    QTimer quitTimer;
    QObject::connect(&quitTimer, &QTimer::timeout, &app, [] {
        if (quitRequested) QCoreApplication::quit();
    });
    quitTimer.start(250);

    QCoreApplication::exec();

    subscriptions.stop();

    return 0;
}

int main(int argc, char** argv) {
    QCoreApplication app{argc, argv};
    QCoreApplication::setApplicationName(QStringLiteral("wemoctl"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    auto* settings = Settings::instance();

    auto cmdOpts = checkOptions(app);
    if (!cmdOpts.valid) return 2;

    if (!cmdOpts.log_file.isEmpty()) {
        WemoLogger::init(cmdOpts.verbose ? WemoLogger::LogType::Trace
                                         : WemoLogger::LogType::Warning,
                         cmdOpts.log_file.toStdString());
        initQtLogger();
    } else {
        settings->initLogger(cmdOpts.verbose ? WemoLogger::LogType::Trace
                                             : WemoLogger::LogType::Warning);
    }

    try {
        if (cmdOpts.command == QStringLiteral("discover"))
            return discoverCommand(cmdOpts, settings);
        if (cmdOpts.command == QStringLiteral("state") ||
            cmdOpts.command == QStringLiteral("on") ||
            cmdOpts.command == QStringLiteral("off") ||
            cmdOpts.command == QStringLiteral("toggle") ||
            cmdOpts.command == QStringLiteral("name"))
            return switchCommand(cmdOpts, settings);
        if (cmdOpts.command == QStringLiteral("listen"))
            return listenCommand(app, cmdOpts, settings);
    } catch (const ControlFault& e) {
        fmt::print(stderr, "device error {}: {}\n", e.code(),
                   e.description().toStdString());
        return 1;
    } catch (const std::runtime_error& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }

    fmt::print(stderr, "unknown command: {}\n",
               cmdOpts.command.toStdString());
    return 2;
}
