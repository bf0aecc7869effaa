#pragma once

#include <QString>

#include "keylight_http.h"
#include "keylight_model.h"

namespace keylight {

struct ProbeResult {
    bool ok = false;
    QString error;
    QString productName;
    QString displayName;
    QString firmwareVersion;
    QString serialNumber;
    bool hasState = false;
    LightState reportedState;
};

// Read-only reachability check. The reported state is informational and
// never fed back into a controller.
ProbeResult runProbe(HttpClient &http,
                     const ConnectionSettings &settings,
                     int timeoutMs = 0);

QString formatProbeResult(const ProbeResult &result);

} // namespace keylight
