#pragma once

#include <iosfwd>

#include <QString>

namespace keylight {

class Notifier
{
public:
    virtual ~Notifier() = default;

    virtual void notifyFailure(const QString &title, const QString &message) = 0;
};

// Writes the notification to a stream and flushes before returning.
class ConsoleNotifier final : public Notifier
{
public:
    explicit ConsoleNotifier(std::ostream &out);

    void notifyFailure(const QString &title, const QString &message) override;

private:
    std::ostream &m_out;
};

} // namespace keylight
