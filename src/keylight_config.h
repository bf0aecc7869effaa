#pragma once

#include <QJsonObject>
#include <QString>

#include "keylight_http.h"
#include "keylight_model.h"

namespace keylight {

// Elgato firmware limits. Temperature is in the device's own unit
// (143 = 7000 K, 344 = 2900 K).
inline constexpr int kMinBrightness = 3;
inline constexpr int kMaxBrightness = 100;
inline constexpr int kMinTemperature = 143;
inline constexpr int kMaxTemperature = 344;
inline constexpr int kDefaultDebounceMs = 300;

struct ControllerConfig {
    ConnectionSettings connection;
    int debounceMs = kDefaultDebounceMs;
    LightBounds brightness{5, kMinBrightness, kMaxBrightness};
    LightBounds temperature{10, kMinTemperature, kMaxTemperature};
    int initialBrightness = 50;
    int initialTemperature = 170;
};

ControllerConfig defaultConfig();

// Keys that are absent or of the wrong type keep the value from base.
ControllerConfig configFromJson(const QJsonObject &obj, const ControllerConfig &base = defaultConfig());

bool loadConfigFile(const QString &path, ControllerConfig *config, QString *error = nullptr);

bool validateConfig(const ControllerConfig &config, QString *error = nullptr);

QJsonObject configToJson(const ControllerConfig &config);

} // namespace keylight
