#pragma once

#include <QByteArray>
#include <QString>

namespace keylight {

inline constexpr const char kApplicationName[] = "keylight-ctl";

QString displayName();
QString description();

// Describes every configuration key with its label and default.
QByteArray configSchemaJson();

} // namespace keylight
