#include "keylight_model.h"

#include <algorithm>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace keylight {

namespace {

bool readIntField(const QJsonObject &obj, const QString &key, int *out)
{
    const QJsonValue value = obj.value(key);
    if (!value.isDouble())
        return false;
    *out = value.toInt();
    return true;
}

} // namespace

bool operator==(const LightState &lhs, const LightState &rhs)
{
    return lhs.on == rhs.on
        && lhs.brightness == rhs.brightness
        && lhs.temperature == rhs.temperature;
}

bool operator!=(const LightState &lhs, const LightState &rhs)
{
    return !(lhs == rhs);
}

std::optional<Direction> parseDirection(const QString &token)
{
    const QString text = token.trimmed().toLower();
    if (text == QLatin1String("up"))
        return Direction::Up;
    if (text == QLatin1String("down"))
        return Direction::Down;
    return std::nullopt;
}

int clampValue(int value, const LightBounds &bounds)
{
    return std::clamp(value, bounds.minimum, bounds.maximum);
}

int stepValue(int value, Direction direction, const LightBounds &bounds)
{
    // Wide arithmetic: any positive step passes validation, including INT_MAX.
    long long next = value;
    switch (direction) {
    case Direction::Up:
        next += bounds.step;
        break;
    case Direction::Down:
        next -= bounds.step;
        break;
    }
    const long long low = bounds.minimum;
    const long long high = bounds.maximum;
    return static_cast<int>(std::clamp(next, low, high));
}

QByteArray buildLightsPayload(const LightState &state)
{
    QJsonObject light;
    light.insert(QStringLiteral("on"), state.on ? 1 : 0);
    light.insert(QStringLiteral("brightness"), state.brightness);
    light.insert(QStringLiteral("temperature"), state.temperature);

    QJsonArray lights;
    lights.append(light);

    QJsonObject body;
    body.insert(QStringLiteral("numberOfLights"), 1);
    body.insert(QStringLiteral("lights"), lights);
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

bool parseLightsPayload(const QByteArray &payload, LightState *state, QString *error)
{
    auto fail = [error](const QString &message) {
        if (error)
            *error = message;
        return false;
    };

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError)
        return fail(parseError.errorString());
    if (!doc.isObject())
        return fail(QStringLiteral("Expected a JSON object"));

    const QJsonArray lights = doc.object().value(QStringLiteral("lights")).toArray();
    if (lights.isEmpty() || !lights.first().isObject())
        return fail(QStringLiteral("Payload contains no lights"));

    const QJsonObject light = lights.first().toObject();
    LightState parsed;
    int on = 0;
    if (!readIntField(light, QStringLiteral("on"), &on)
        || !readIntField(light, QStringLiteral("brightness"), &parsed.brightness)
        || !readIntField(light, QStringLiteral("temperature"), &parsed.temperature)) {
        return fail(QStringLiteral("Light entry is missing on/brightness/temperature"));
    }
    parsed.on = on != 0;

    if (state)
        *state = parsed;
    if (error)
        error->clear();
    return true;
}

QString describeState(const LightState &state)
{
    return QStringLiteral("on=%1 brightness=%2 temperature=%3")
        .arg(state.on ? QStringLiteral("1") : QStringLiteral("0"))
        .arg(state.brightness)
        .arg(state.temperature);
}

} // namespace keylight
