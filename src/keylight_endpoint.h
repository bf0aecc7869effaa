#pragma once

#include <functional>

#include <QNetworkAccessManager>
#include <QString>

#include "keylight_http.h"
#include "keylight_model.h"

namespace keylight {

inline constexpr const char kLightsPath[] = "/elgato/lights";
inline constexpr const char kAccessoryInfoPath[] = "/elgato/accessory-info";

struct SyncResult {
    bool ok = false;
    int statusCode = 0;
    QString error;
};

// The device side of a synchronization. Implementations report every
// sendUpdate() exactly once through done, even when the request could not
// be created.
class LightEndpoint
{
public:
    using Completion = std::function<void(const SyncResult &)>;

    virtual ~LightEndpoint() = default;

    virtual void sendUpdate(const LightState &state, Completion done) = 0;
    virtual QString describe() const = 0;
};

class HttpLightEndpoint final : public LightEndpoint
{
public:
    explicit HttpLightEndpoint(const ConnectionSettings &settings);

    void sendUpdate(const LightState &state, Completion done) override;
    QString describe() const override;

    const ConnectionSettings &settings() const { return m_settings; }

private:
    ConnectionSettings m_settings;
    QNetworkAccessManager m_network;
    HttpClient m_http;
};

} // namespace keylight
