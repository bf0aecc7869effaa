#pragma once

#include <optional>

#include <QByteArray>
#include <QMetaType>
#include <QString>

namespace keylight {

struct LightState {
    bool on = false;
    int brightness = 50;
    int temperature = 170;
};

bool operator==(const LightState &lhs, const LightState &rhs);
bool operator!=(const LightState &lhs, const LightState &rhs);

struct LightBounds {
    int step = 1;
    int minimum = 0;
    int maximum = 100;
};

enum class Direction {
    Up,
    Down
};

std::optional<Direction> parseDirection(const QString &token);

int clampValue(int value, const LightBounds &bounds);
int stepValue(int value, Direction direction, const LightBounds &bounds);

// {"numberOfLights":1,"lights":[{"on":0|1,"brightness":N,"temperature":N}]}
QByteArray buildLightsPayload(const LightState &state);

bool parseLightsPayload(const QByteArray &payload, LightState *state, QString *error = nullptr);

QString describeState(const LightState &state);

} // namespace keylight

Q_DECLARE_METATYPE(keylight::LightState)
