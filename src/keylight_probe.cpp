#include "keylight_probe.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QStringList>

#include "keylight_endpoint.h"

Q_LOGGING_CATEGORY(probeLog, "keylight.probe");

namespace keylight {

namespace {

bool parseAccessoryInfo(const QByteArray &payload, ProbeResult *out, QString *error)
{
    const QJsonDocument doc = QJsonDocument::fromJson(payload);
    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("Unexpected accessory-info response from light");
        return false;
    }

    const QJsonObject info = doc.object();
    out->productName = info.value(QStringLiteral("productName")).toString().trimmed();
    out->displayName = info.value(QStringLiteral("displayName")).toString().trimmed();
    out->firmwareVersion = info.value(QStringLiteral("firmwareVersion")).toString().trimmed();
    out->serialNumber = info.value(QStringLiteral("serialNumber")).toString().trimmed();
    return true;
}

} // namespace

ProbeResult runProbe(HttpClient &http, const ConnectionSettings &settings, int timeoutMs)
{
    ProbeResult out;

    if (HttpClient::effectiveHost(settings).isEmpty()) {
        out.error = QStringLiteral("Host must not be empty");
        return out;
    }

    const HttpResult info = http.get(settings, QString::fromLatin1(kAccessoryInfoPath), timeoutMs);
    if (!info.ok) {
        out.error = info.error.isEmpty() ? QStringLiteral("Light did not answer") : info.error;
        return out;
    }

    QString parseError;
    if (!parseAccessoryInfo(info.payload, &out, &parseError)) {
        out.error = parseError;
        return out;
    }

    // State is optional once accessory-info answered.
    const HttpResult lights = http.get(settings, QString::fromLatin1(kLightsPath), timeoutMs);
    if (lights.ok) {
        QString stateError;
        out.hasState = parseLightsPayload(lights.payload, &out.reportedState, &stateError);
        if (!out.hasState)
            qCDebug(probeLog) << "could not read light state:" << stateError;
    } else {
        qCDebug(probeLog) << "light state unavailable:" << lights.error;
    }

    out.ok = true;
    return out;
}

QString formatProbeResult(const ProbeResult &result)
{
    if (!result.ok)
        return QStringLiteral("probe failed: %1").arg(result.error);

    QStringList lines;
    lines << QStringLiteral("product:  %1").arg(result.productName.isEmpty() ? QStringLiteral("?") : result.productName);
    if (!result.displayName.isEmpty())
        lines << QStringLiteral("name:     %1").arg(result.displayName);
    lines << QStringLiteral("firmware: %1").arg(result.firmwareVersion.isEmpty() ? QStringLiteral("?") : result.firmwareVersion);
    lines << QStringLiteral("serial:   %1").arg(result.serialNumber.isEmpty() ? QStringLiteral("?") : result.serialNumber);
    if (result.hasState)
        lines << QStringLiteral("state:    %1").arg(describeState(result.reportedState));
    return lines.join(QLatin1Char('\n'));
}

} // namespace keylight
