#include "keylight_debounce.h"

#include <algorithm>
#include <utility>

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(debounceLog, "keylight.debounce");

namespace keylight {

DebounceScheduler::DebounceScheduler()
{
    m_timer.setSingleShot(true);
    QObject::connect(&m_timer, &QTimer::timeout, &m_timer, [this]() { fire(); });
}

void DebounceScheduler::schedule(Action action, int delayMs)
{
    if (m_timer.isActive())
        qCDebug(debounceLog) << "superseding pending action," << m_timer.remainingTime() << "ms left";

    m_timer.stop();
    m_action = std::move(action);
    m_timer.start(std::max(0, delayMs));
}

bool DebounceScheduler::isPending() const
{
    return m_timer.isActive() && m_action != nullptr;
}

int DebounceScheduler::remainingMs() const
{
    return isPending() ? m_timer.remainingTime() : -1;
}

bool DebounceScheduler::flush()
{
    if (!isPending())
        return false;
    fire();
    return true;
}

void DebounceScheduler::cancel()
{
    m_timer.stop();
    m_action = nullptr;
}

void DebounceScheduler::fire()
{
    m_timer.stop();
    // Cleared before running so the action may schedule again.
    Action action = std::move(m_action);
    m_action = nullptr;
    if (action)
        action();
}

} // namespace keylight
