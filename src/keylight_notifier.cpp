#include "keylight_notifier.h"

#include <ostream>

namespace keylight {

ConsoleNotifier::ConsoleNotifier(std::ostream &out)
    : m_out(out)
{
}

void ConsoleNotifier::notifyFailure(const QString &title, const QString &message)
{
    m_out << "[" << title.toStdString() << "] " << message.toStdString() << std::endl;
}

} // namespace keylight
