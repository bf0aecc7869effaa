#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QNetworkAccessManager>
#include <QTimer>

#include "keylight_config.h"
#include "keylight_controller.h"
#include "keylight_endpoint.h"
#include "keylight_http.h"
#include "keylight_notifier.h"
#include "keylight_probe.h"
#include "keylight_schema.h"
#include "keylight_trigger.h"

namespace {

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

bool parseIntOption(const QCommandLineParser &parser, const QCommandLineOption &option, int *out)
{
    if (!parser.isSet(option))
        return true;
    bool ok = false;
    const int value = parser.value(option).toInt(&ok);
    if (!ok) {
        std::cerr << "invalid value for --" << option.names().constFirst().toStdString()
                  << ": " << parser.value(option).toStdString() << '\n';
        return false;
    }
    *out = value;
    return true;
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QString::fromLatin1(keylight::kApplicationName));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(keylight::description());
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(QStringLiteral("config"),
                                          QStringLiteral("Read settings from a JSON file."),
                                          QStringLiteral("file"));
    const QCommandLineOption hostOption(QStringLiteral("host"),
                                        QStringLiteral("Light host name or address."),
                                        QStringLiteral("host"));
    const QCommandLineOption portOption(QStringLiteral("port"),
                                        QStringLiteral("Light HTTP port."),
                                        QStringLiteral("port"));
    const QCommandLineOption debounceOption(QStringLiteral("debounce-ms"),
                                            QStringLiteral("Quiet interval before stepped changes are sent."),
                                            QStringLiteral("ms"));
    const QCommandLineOption probeOption(QStringLiteral("probe"),
                                         QStringLiteral("Check that the light answers, then exit."));
    const QCommandLineOption schemaOption(QStringLiteral("print-schema"),
                                          QStringLiteral("Print the configuration schema, then exit."));
    parser.addOption(configOption);
    parser.addOption(hostOption);
    parser.addOption(portOption);
    parser.addOption(debounceOption);
    parser.addOption(probeOption);
    parser.addOption(schemaOption);
    parser.process(app);

    if (parser.isSet(schemaOption)) {
        std::cout << keylight::configSchemaJson().toStdString();
        return 0;
    }

    keylight::ControllerConfig config = keylight::defaultConfig();
    QString error;

    if (parser.isSet(configOption) && !keylight::loadConfigFile(parser.value(configOption), &config, &error)) {
        std::cerr << "failed to load configuration: " << error.toStdString() << '\n';
        return 1;
    }

    const char *envHost = std::getenv("KEYLIGHT_HOST");
    if (parser.isSet(hostOption))
        config.connection.host = parser.value(hostOption).trimmed();
    else if (envHost && config.connection.host.isEmpty())
        config.connection.host = QString::fromLocal8Bit(envHost).trimmed();

    if (!parseIntOption(parser, portOption, &config.connection.port)
        || !parseIntOption(parser, debounceOption, &config.debounceMs)) {
        return 1;
    }

    if (!keylight::validateConfig(config, &error)) {
        std::cerr << "invalid configuration: " << error.toStdString() << '\n';
        return 1;
    }

    if (parser.isSet(probeOption)) {
        QNetworkAccessManager network;
        keylight::HttpClient http(&network);
        const keylight::ProbeResult result = keylight::runProbe(http, config.connection);
        std::cout << keylight::formatProbeResult(result).toStdString() << '\n';
        return result.ok ? 0 : 1;
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    keylight::HttpLightEndpoint endpoint(config.connection);
    keylight::LightController controller(config, &endpoint);
    keylight::ConsoleNotifier notifier(std::cerr);

    QObject::connect(&controller, &keylight::LightController::synchronizationFailed, &app,
                     [&notifier](const QString &message) {
                         notifier.notifyFailure(keylight::displayName(), message);
                     });

    keylight::StdinTriggerSource triggers(controller);
    if (!triggers.start(&error)) {
        std::cerr << "failed to start trigger source: " << error.toStdString() << '\n';
        return 1;
    }

    bool finishing = false;
    auto quitWhenIdle = [&]() {
        if (!controller.isSyncInFlight())
            app.quit();
    };
    auto finish = [&]() {
        if (finishing)
            return;
        finishing = true;
        triggers.stop();
        // The last stepped intent must still reach the light.
        controller.flushPending();
        QObject::connect(&controller, &keylight::LightController::synchronized, &app,
                         quitWhenIdle, Qt::QueuedConnection);
        QObject::connect(&controller, &keylight::LightController::synchronizationFailed, &app,
                         quitWhenIdle, Qt::QueuedConnection);
        quitWhenIdle();
    };

    QObject::connect(&triggers, &keylight::StdinTriggerSource::endOfInput, &app, finish);

    QTimer signalPoll;
    signalPoll.setInterval(250);
    QObject::connect(&signalPoll, &QTimer::timeout, &app, [&]() {
        if (!g_running.load())
            finish();
    });
    signalPoll.start();

    std::cerr << "starting " << keylight::kApplicationName
              << " light=" << endpoint.describe().toStdString()
              << " debounceMs=" << config.debounceMs << '\n';

    const int rc = app.exec();

    std::cerr << "stopping " << keylight::kApplicationName << '\n';
    return rc;
}
