#include "keylight_schema.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "keylight_config.h"

namespace keylight {

namespace {

QJsonObject field(const QString &key,
                  const QString &type,
                  const QString &label,
                  const QString &description,
                  const QJsonValue &defaultValue = QJsonValue(),
                  const QJsonArray &flags = {})
{
    QJsonObject out;
    out.insert(QStringLiteral("key"), key);
    out.insert(QStringLiteral("type"), type);
    out.insert(QStringLiteral("label"), label);
    out.insert(QStringLiteral("description"), description);
    if (!defaultValue.isUndefined() && !defaultValue.isNull())
        out.insert(QStringLiteral("default"), defaultValue);
    if (!flags.isEmpty())
        out.insert(QStringLiteral("flags"), flags);
    return out;
}

QJsonArray boundsFields(const QString &prefix,
                        const QString &label,
                        const LightBounds &bounds,
                        int initial)
{
    QJsonArray fields;
    fields.append(field(prefix + QStringLiteral(".step"),
                        QStringLiteral("Integer"),
                        QStringLiteral("%1 step").arg(label),
                        QStringLiteral("Amount added or removed per key press."),
                        QJsonValue(bounds.step)));
    fields.append(field(prefix + QStringLiteral(".min"),
                        QStringLiteral("Integer"),
                        QStringLiteral("%1 minimum").arg(label),
                        QStringLiteral("Lowest value ever sent to the light."),
                        QJsonValue(bounds.minimum)));
    fields.append(field(prefix + QStringLiteral(".max"),
                        QStringLiteral("Integer"),
                        QStringLiteral("%1 maximum").arg(label),
                        QStringLiteral("Highest value ever sent to the light."),
                        QJsonValue(bounds.maximum)));
    fields.append(field(prefix + QStringLiteral(".initial"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Initial %1").arg(label.toLower()),
                        QStringLiteral("Value assumed at startup, clamped into range."),
                        QJsonValue(initial)));
    return fields;
}

QJsonArray schemaFields()
{
    const ControllerConfig defaults = defaultConfig();
    QJsonArray fields;

    QJsonArray hostFlags;
    hostFlags.append(QStringLiteral("Required"));
    fields.append(field(QStringLiteral("host"),
                        QStringLiteral("Hostname"),
                        QStringLiteral("Light host"),
                        QStringLiteral("IP address or hostname of the light."),
                        QJsonValue(),
                        hostFlags));

    fields.append(field(QStringLiteral("port"),
                        QStringLiteral("Port"),
                        QStringLiteral("Port"),
                        QStringLiteral("TCP port of the light's HTTP API."),
                        QJsonValue(defaults.connection.port)));

    fields.append(field(QStringLiteral("useTls"),
                        QStringLiteral("Boolean"),
                        QStringLiteral("Use HTTPS"),
                        QStringLiteral("Use HTTPS when talking to the light."),
                        QJsonValue(defaults.connection.useTls)));

    fields.append(field(QStringLiteral("timeoutMs"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Request timeout"),
                        QStringLiteral("Abort an update request after this many milliseconds."),
                        QJsonValue(defaults.connection.timeoutMs)));

    fields.append(field(QStringLiteral("debounceMs"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Debounce delay"),
                        QStringLiteral("Quiet interval before a brightness or temperature change is sent."),
                        QJsonValue(defaults.debounceMs)));

    for (const QJsonValue &value : boundsFields(QStringLiteral("brightness"),
                                                QStringLiteral("Brightness"),
                                                defaults.brightness,
                                                defaults.initialBrightness)) {
        fields.append(value);
    }
    for (const QJsonValue &value : boundsFields(QStringLiteral("temperature"),
                                                QStringLiteral("Temperature"),
                                                defaults.temperature,
                                                defaults.initialTemperature)) {
        fields.append(value);
    }

    return fields;
}

} // namespace

QString displayName()
{
    return QStringLiteral("Key Light controller");
}

QString description()
{
    return QStringLiteral("Drives an Elgato-style key light from discrete input triggers");
}

QByteArray configSchemaJson()
{
    QJsonObject schema;
    schema.insert(QStringLiteral("title"), displayName());
    schema.insert(QStringLiteral("description"), description());
    schema.insert(QStringLiteral("fields"), schemaFields());
    return QJsonDocument(schema).toJson(QJsonDocument::Indented);
}

} // namespace keylight
