#pragma once

#include <QObject>
#include <QString>

#include "keylight_config.h"
#include "keylight_debounce.h"
#include "keylight_endpoint.h"
#include "keylight_model.h"

namespace keylight {

// Owns the desired light state and pushes it to a LightEndpoint.
//
// Power toggles are sent immediately. Brightness and temperature steps are
// coalesced by a DebounceScheduler so a held key produces one request once
// input goes quiet. Endpoint calls never overlap: a request asked for while
// another is outstanding is sent after it completes, carrying the latest
// state.
class LightController : public QObject
{
    Q_OBJECT
public:
    LightController(const ControllerConfig &config, LightEndpoint *endpoint, QObject *parent = nullptr);
    ~LightController() override;

    const LightState &state() const { return m_state; }
    const ControllerConfig &config() const { return m_config; }

    bool isSyncPending() const;
    bool isSyncInFlight() const { return m_syncInFlight; }

    void togglePower();

    void stepBrightness(Direction direction);
    // Unknown direction tokens are ignored.
    void stepBrightness(const QString &direction);

    void stepTemperature(Direction direction);
    void stepTemperature(const QString &direction);

    void synchronizeNow();

    // Sends a pending debounced update right away. Used on shutdown.
    bool flushPending();

signals:
    void stateChanged(const keylight::LightState &state);
    void synchronized(const keylight::LightState &state);
    void synchronizationFailed(const QString &error);

private:
    void applyStep(int *value, Direction direction, const LightBounds &bounds, const char *axis);
    void scheduleSync();
    void onSyncFinished(const LightState &sent, const SyncResult &result);

    ControllerConfig m_config;
    LightEndpoint *m_endpoint = nullptr;
    LightState m_state;
    DebounceScheduler m_scheduler;
    bool m_syncInFlight = false;
    bool m_resyncQueued = false;
};

} // namespace keylight
