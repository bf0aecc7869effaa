#include "keylight_endpoint.h"

#include <utility>

#include <QLoggingCategory>
#include <QUrl>

Q_LOGGING_CATEGORY(endpointLog, "keylight.endpoint");

namespace keylight {

HttpLightEndpoint::HttpLightEndpoint(const ConnectionSettings &settings)
    : m_settings(settings)
    , m_http(&m_network)
{
}

void HttpLightEndpoint::sendUpdate(const LightState &state, Completion done)
{
    const QByteArray payload = buildLightsPayload(state);
    qCDebug(endpointLog).noquote() << "PUT" << describe() << payload;

    QString error;
    const bool started = m_http.putJsonAsync(
        m_settings,
        QString::fromLatin1(kLightsPath),
        payload,
        [done](const HttpResult &http) {
            SyncResult result;
            result.ok = http.ok;
            result.statusCode = http.statusCode;
            result.error = http.error;
            if (!result.ok && result.error.isEmpty())
                result.error = QStringLiteral("Light update failed");
            if (done)
                done(result);
        },
        &error);

    if (!started) {
        SyncResult result;
        result.error = error.isEmpty() ? QStringLiteral("Light update could not be sent") : error;
        if (done)
            done(result);
    }
}

QString HttpLightEndpoint::describe() const
{
    return HttpClient::lightUrl(m_settings, QString::fromLatin1(kLightsPath)).toString();
}

} // namespace keylight
