#pragma once

#include <functional>

#include <QTimer>

namespace keylight {

// Single-slot deferred action. schedule() replaces whatever was armed
// before: the timer restarts and only the newest action can run.
class DebounceScheduler
{
public:
    using Action = std::function<void()>;

    DebounceScheduler();
    DebounceScheduler(const DebounceScheduler &) = delete;
    DebounceScheduler &operator=(const DebounceScheduler &) = delete;

    void schedule(Action action, int delayMs);
    bool isPending() const;
    int remainingMs() const;

    // Runs a pending action now. Returns false when nothing was armed.
    bool flush();

    void cancel();

private:
    void fire();

    QTimer m_timer;
    Action m_action;
};

} // namespace keylight
