#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "cli/device_report.hpp"
#include "core/cancellation.hpp"
#include "core/logging.hpp"
#include "network/discovery_config.hpp"
#include "network/discovery_session.hpp"

#include <atomic>
#include <csignal>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitTransport = 1;
constexpr int kExitUsage = 2;

std::atomic<bool>* g_cancel_flag = nullptr;

void handle_interrupt(int) {
    if (g_cancel_flag) {
        g_cancel_flag->store(true, std::memory_order_release);
    }
}

int usage_error(const QString& message) {
    QTextStream(stderr) << "lanscout: " << message << QLatin1Char('\n');
    return kExitUsage;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("lanscout");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Discover STM32 devices on the local network"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption timeoutOption(
        QStringList{QStringLiteral("t"), QStringLiteral("timeout")},
        QStringLiteral("Discovery timeout in seconds (default: 5)."),
        QStringLiteral("seconds"));
    parser.addOption(timeoutOption);

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("p"), QStringLiteral("port")},
        QStringLiteral("Discovery UDP port (default: 5678)."),
        QStringLiteral("port"));
    parser.addOption(portOption);

    const QCommandLineOption broadcastOption(
        QStringList{QStringLiteral("b"), QStringLiteral("broadcast")},
        QStringLiteral("Probe destination address (default: 255.255.255.255)."),
        QStringLiteral("address"));
    parser.addOption(broadcastOption);

    const QCommandLineOption pollOption(
        QStringList{QStringLiteral("poll-interval")},
        QStringLiteral("Longest single receive wait in ms; bounds how fast an interrupt is noticed (default: 250)."),
        QStringLiteral("ms"));
    parser.addOption(pollOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Print the result as JSON."));
    parser.addOption(jsonOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable debug logging (also enabled by LANSCOUT_DEBUG=1)."));
    parser.addOption(debugOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Append log output to this file."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    parser.process(app);

    lanscout::install_log_handler(lanscout::LogOptions{
        .debug = parser.isSet(debugOption) || qEnvironmentVariableIsSet("LANSCOUT_DEBUG"),
        .file_path = parser.value(logFileOption),
    });

    auto env = lanscout::network::apply_environment(lanscout::network::DiscoveryConfig{});
    if (env.is_err()) {
        return usage_error(QString::fromStdString(env.unwrap_err().message));
    }
    auto config = env.unwrap();

    if (parser.isSet(timeoutOption)) {
        auto window = lanscout::network::parse_window_seconds(parser.value(timeoutOption));
        if (window.is_err()) {
            return usage_error(QString::fromStdString(window.unwrap_err().message));
        }
        config.window = window.unwrap();
    }
    if (parser.isSet(portOption)) {
        auto port = lanscout::network::parse_port(parser.value(portOption));
        if (port.is_err()) {
            return usage_error(QString::fromStdString(port.unwrap_err().message));
        }
        config.port = port.unwrap();
    }
    if (parser.isSet(broadcastOption)) {
        auto address = lanscout::network::parse_broadcast_address(parser.value(broadcastOption));
        if (address.is_err()) {
            return usage_error(QString::fromStdString(address.unwrap_err().message));
        }
        config.broadcast_address = address.unwrap();
    }
    if (parser.isSet(pollOption)) {
        auto poll = lanscout::network::parse_poll_interval_ms(parser.value(pollOption));
        if (poll.is_err()) {
            return usage_error(QString::fromStdString(poll.unwrap_err().message));
        }
        config.poll_interval = poll.unwrap();
    }
    if (const auto valid = config.validate(); valid.is_err()) {
        return usage_error(QString::fromStdString(valid.unwrap_err().message));
    }

    // Ctrl+C ends the window early; whatever arrived so far is still reported.
    lanscout::CancellationToken token;
    g_cancel_flag = token.flag();
    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    const bool json = parser.isSet(jsonOption);

    lanscout::network::DiscoverySession session(config, token);
    if (!json) {
        session.on_listening = [&](uint16_t) {
            QTextStream(stdout) << lanscout::cli::format_listening_banner(config.window) << QLatin1Char('\n');
        };
        session.on_device = [](const lanscout::network::DeviceRecord& device) {
            QTextStream(stdout) << lanscout::cli::format_device_block(device);
        };
    }

    const auto result = session.run();

    if (result.is_err()) {
        const auto& error = result.unwrap_err();
        QTextStream(stderr) << "lanscout: discovery failed (" << lanscout::to_string(error.kind)
                            << "): " << QString::fromStdString(error.message) << QLatin1Char('\n');
        return kExitTransport;
    }

    const auto& outcome = result.unwrap();
    if (json) {
        QTextStream(stdout) << lanscout::cli::format_result_json(outcome);
        return kExitOk;
    }

    if (outcome.receive_error) {
        QTextStream(stderr) << lanscout::cli::format_receive_warning(*outcome.receive_error);
    }
    QTextStream(stdout) << lanscout::cli::format_summary(outcome.devices.size());
    if (outcome.cancelled) {
        QTextStream(stdout) << "\nDiscovery cancelled.\n";
    }
    return kExitOk;
}
