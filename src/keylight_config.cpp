#include "keylight_config.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonValue>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(configLog, "keylight.config");

namespace keylight {

namespace {

int readInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;
    const QJsonValue value = obj.value(key);
    if (!value.isDouble()) {
        qCWarning(configLog) << "ignoring non-integer value for" << key;
        return fallback;
    }
    return value.toInt(fallback);
}

bool readBool(const QJsonObject &obj, const QString &key, bool fallback)
{
    const QJsonValue value = obj.value(key);
    if (value.isBool())
        return value.toBool();
    if (!value.isUndefined())
        qCWarning(configLog) << "ignoring non-boolean value for" << key;
    return fallback;
}

QString readString(const QJsonObject &obj, const QString &key, const QString &fallback)
{
    const QJsonValue value = obj.value(key);
    if (value.isString())
        return value.toString().trimmed();
    return fallback;
}

LightBounds readBounds(const QJsonObject &obj, const QString &key, const LightBounds &fallback)
{
    const QJsonObject section = obj.value(key).toObject();
    LightBounds out = fallback;
    out.step = readInt(section, QStringLiteral("step"), fallback.step);
    out.minimum = readInt(section, QStringLiteral("min"), fallback.minimum);
    out.maximum = readInt(section, QStringLiteral("max"), fallback.maximum);
    return out;
}

QJsonObject boundsToJson(const LightBounds &bounds, int initial)
{
    QJsonObject out;
    out.insert(QStringLiteral("step"), bounds.step);
    out.insert(QStringLiteral("min"), bounds.minimum);
    out.insert(QStringLiteral("max"), bounds.maximum);
    out.insert(QStringLiteral("initial"), initial);
    return out;
}

bool checkBounds(const QString &name, const LightBounds &bounds, QString *error)
{
    if (bounds.step <= 0) {
        if (error)
            *error = QStringLiteral("%1 step must be positive").arg(name);
        return false;
    }
    if (bounds.minimum > bounds.maximum) {
        if (error)
            *error = QStringLiteral("%1 minimum %2 exceeds maximum %3")
                         .arg(name)
                         .arg(bounds.minimum)
                         .arg(bounds.maximum);
        return false;
    }
    return true;
}

} // namespace

ControllerConfig defaultConfig()
{
    return ControllerConfig();
}

ControllerConfig configFromJson(const QJsonObject &obj, const ControllerConfig &base)
{
    ControllerConfig config = base;

    config.connection.host = readString(obj, QStringLiteral("host"), base.connection.host);
    config.connection.ip = readString(obj, QStringLiteral("ip"), base.connection.ip);
    config.connection.port = readInt(obj, QStringLiteral("port"), base.connection.port);
    config.connection.useTls = readBool(obj, QStringLiteral("useTls"), base.connection.useTls);
    config.connection.timeoutMs = readInt(obj, QStringLiteral("timeoutMs"), base.connection.timeoutMs);
    config.debounceMs = readInt(obj, QStringLiteral("debounceMs"), base.debounceMs);

    config.brightness = readBounds(obj, QStringLiteral("brightness"), base.brightness);
    config.initialBrightness = readInt(obj.value(QStringLiteral("brightness")).toObject(),
                                       QStringLiteral("initial"),
                                       base.initialBrightness);

    config.temperature = readBounds(obj, QStringLiteral("temperature"), base.temperature);
    config.initialTemperature = readInt(obj.value(QStringLiteral("temperature")).toObject(),
                                        QStringLiteral("initial"),
                                        base.initialTemperature);
    return config;
}

bool loadConfigFile(const QString &path, ControllerConfig *config, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error)
            *error = QStringLiteral("%1: %2 at offset %3")
                         .arg(path, parseError.errorString())
                         .arg(parseError.offset);
        return false;
    }
    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("%1: top-level JSON value must be an object").arg(path);
        return false;
    }

    if (config)
        *config = configFromJson(doc.object(), *config);
    qCDebug(configLog) << "loaded configuration from" << path;
    if (error)
        error->clear();
    return true;
}

bool validateConfig(const ControllerConfig &config, QString *error)
{
    if (HttpClient::effectiveHost(config.connection).isEmpty()) {
        if (error)
            *error = QStringLiteral("Light host must not be empty");
        return false;
    }
    if (config.connection.port <= 0 || config.connection.port > 65535) {
        if (error)
            *error = QStringLiteral("Port %1 is out of range").arg(config.connection.port);
        return false;
    }
    if (config.debounceMs < 0) {
        if (error)
            *error = QStringLiteral("Debounce delay must not be negative");
        return false;
    }
    if (!checkBounds(QStringLiteral("Brightness"), config.brightness, error))
        return false;
    if (!checkBounds(QStringLiteral("Temperature"), config.temperature, error))
        return false;

    if (error)
        error->clear();
    return true;
}

QJsonObject configToJson(const ControllerConfig &config)
{
    QJsonObject out;
    out.insert(QStringLiteral("host"), config.connection.host);
    if (!config.connection.ip.isEmpty())
        out.insert(QStringLiteral("ip"), config.connection.ip);
    out.insert(QStringLiteral("port"), config.connection.port);
    out.insert(QStringLiteral("useTls"), config.connection.useTls);
    out.insert(QStringLiteral("timeoutMs"), config.connection.timeoutMs);
    out.insert(QStringLiteral("debounceMs"), config.debounceMs);
    out.insert(QStringLiteral("brightness"), boundsToJson(config.brightness, config.initialBrightness));
    out.insert(QStringLiteral("temperature"), boundsToJson(config.temperature, config.initialTemperature));
    return out;
}

} // namespace keylight
