#include "keylight_controller.h"

#include <QLoggingCategory>
#include <QPointer>

Q_LOGGING_CATEGORY(controllerLog, "keylight.controller");

namespace keylight {

LightController::LightController(const ControllerConfig &config, LightEndpoint *endpoint, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_endpoint(endpoint)
{
    m_state.on = false;
    m_state.brightness = clampValue(config.initialBrightness, config.brightness);
    m_state.temperature = clampValue(config.initialTemperature, config.temperature);

    if (m_state.brightness != config.initialBrightness || m_state.temperature != config.initialTemperature) {
        qCWarning(controllerLog).noquote() << "initial state clamped to" << describeState(m_state);
    }
}

LightController::~LightController()
{
    m_scheduler.cancel();
}

bool LightController::isSyncPending() const
{
    return m_scheduler.isPending();
}

void LightController::togglePower()
{
    m_state.on = !m_state.on;
    qCInfo(controllerLog) << "power" << (m_state.on ? "on" : "off");
    emit stateChanged(m_state);
    // Not debounced, and a pending brightness/temperature update stays armed.
    synchronizeNow();
}

void LightController::stepBrightness(Direction direction)
{
    applyStep(&m_state.brightness, direction, m_config.brightness, "brightness");
}

void LightController::stepBrightness(const QString &direction)
{
    const auto parsed = parseDirection(direction);
    if (!parsed.has_value()) {
        qCDebug(controllerLog) << "ignoring brightness step with direction" << direction;
        return;
    }
    stepBrightness(*parsed);
}

void LightController::stepTemperature(Direction direction)
{
    applyStep(&m_state.temperature, direction, m_config.temperature, "temperature");
}

void LightController::stepTemperature(const QString &direction)
{
    const auto parsed = parseDirection(direction);
    if (!parsed.has_value()) {
        qCDebug(controllerLog) << "ignoring temperature step with direction" << direction;
        return;
    }
    stepTemperature(*parsed);
}

void LightController::applyStep(int *value, Direction direction, const LightBounds &bounds, const char *axis)
{
    const int before = *value;
    *value = stepValue(before, direction, bounds);
    qCDebug(controllerLog) << axis << before << "->" << *value;
    if (*value != before)
        emit stateChanged(m_state);
    scheduleSync();
}

void LightController::scheduleSync()
{
    m_scheduler.schedule([this]() { synchronizeNow(); }, m_config.debounceMs);
}

bool LightController::flushPending()
{
    return m_scheduler.flush();
}

void LightController::synchronizeNow()
{
    if (!m_endpoint) {
        qCWarning(controllerLog) << "no light endpoint configured";
        emit synchronizationFailed(QStringLiteral("No light endpoint configured"));
        return;
    }

    if (m_syncInFlight) {
        m_resyncQueued = true;
        return;
    }

    m_syncInFlight = true;
    const LightState sent = m_state;
    qCDebug(controllerLog).noquote() << "synchronizing" << describeState(sent) << "to" << m_endpoint->describe();

    QPointer<LightController> guard(this);
    m_endpoint->sendUpdate(sent, [guard, sent](const SyncResult &result) {
        if (!guard)
            return;
        guard->onSyncFinished(sent, result);
    });
}

void LightController::onSyncFinished(const LightState &sent, const SyncResult &result)
{
    m_syncInFlight = false;

    if (result.ok) {
        qCInfo(controllerLog).noquote() << "light updated:" << describeState(sent);
        emit synchronized(sent);
    } else {
        // Desired state stays as is; the next intent tries again.
        qCWarning(controllerLog).noquote() << "light update failed:" << result.error;
        emit synchronizationFailed(result.error);
    }

    if (m_resyncQueued) {
        m_resyncQueued = false;
        synchronizeNow();
    }
}

} // namespace keylight
