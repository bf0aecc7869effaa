#include "keylight_trigger.h"

#include <cerrno>
#include <cstring>

#include <unistd.h>

#include <QLoggingCategory>
#include <QSocketNotifier>

#include "keylight_controller.h"

Q_LOGGING_CATEGORY(triggerLog, "keylight.trigger");

namespace keylight {

namespace {

constexpr int kMaxLineLength = 256;

} // namespace

std::optional<Intent> parseIntent(const QString &line)
{
    const QString text = line.trimmed().toLower();
    if (text.isEmpty() || text.startsWith(QLatin1Char('#')))
        return std::nullopt;

    if (text == QLatin1String("toggle"))
        return Intent{IntentKind::TogglePower, {}};
    if (text == QLatin1String("sync"))
        return Intent{IntentKind::Synchronize, {}};

    const int sep = text.indexOf(QLatin1Char(':'));
    if (sep <= 0)
        return std::nullopt;

    const QString target = text.left(sep).trimmed();
    const QString direction = text.mid(sep + 1).trimmed();
    if (target == QLatin1String("brightness"))
        return Intent{IntentKind::Brightness, direction};
    if (target == QLatin1String("temperature"))
        return Intent{IntentKind::Temperature, direction};
    return std::nullopt;
}

void dispatchIntent(LightController &controller, const Intent &intent)
{
    switch (intent.kind) {
    case IntentKind::TogglePower:
        controller.togglePower();
        break;
    case IntentKind::Brightness:
        controller.stepBrightness(intent.direction);
        break;
    case IntentKind::Temperature:
        controller.stepTemperature(intent.direction);
        break;
    case IntentKind::Synchronize:
        controller.synchronizeNow();
        break;
    }
}

StdinTriggerSource::StdinTriggerSource(LightController &controller, int fd, QObject *parent)
    : QObject(parent)
    , m_controller(controller)
    , m_fd(fd)
{
}

StdinTriggerSource::~StdinTriggerSource()
{
    stop();
}

bool StdinTriggerSource::start(QString *error)
{
    if (m_notifier)
        return true;
    if (m_fd < 0) {
        if (error)
            *error = QStringLiteral("Invalid input descriptor");
        return false;
    }

    m_notifier = new QSocketNotifier(m_fd, QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &StdinTriggerSource::onActivated);
    qCDebug(triggerLog) << "listening for intents on fd" << m_fd;
    if (error)
        error->clear();
    return true;
}

void StdinTriggerSource::stop()
{
    if (!m_notifier)
        return;
    m_notifier->setEnabled(false);
    m_notifier->deleteLater();
    m_notifier = nullptr;
}

void StdinTriggerSource::onActivated()
{
    char buf[512];
    const ssize_t n = ::read(m_fd, buf, sizeof(buf));
    if (n > 0) {
        feed(QByteArray(buf, static_cast<int>(n)));
        return;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN))
        return;

    if (n < 0)
        qCWarning(triggerLog) << "reading intents failed:" << std::strerror(errno);
    if (!m_buffer.isEmpty()) {
        const QByteArray rest = m_buffer;
        m_buffer.clear();
        handleLine(rest);
    }
    stop();
    emit endOfInput();
}

void StdinTriggerSource::feed(const QByteArray &data)
{
    m_buffer.append(data);

    int newline = m_buffer.indexOf('\n');
    while (newline >= 0) {
        const QByteArray line = m_buffer.left(newline);
        m_buffer.remove(0, newline + 1);
        handleLine(line);
        newline = m_buffer.indexOf('\n');
    }

    if (m_buffer.size() > kMaxLineLength) {
        qCWarning(triggerLog) << "discarding over-long input line";
        m_buffer.clear();
    }
}

void StdinTriggerSource::handleLine(const QByteArray &line)
{
    const QString text = QString::fromUtf8(line);
    const auto intent = parseIntent(text);
    if (!intent.has_value()) {
        if (!text.trimmed().isEmpty() && !text.trimmed().startsWith(QLatin1Char('#')))
            qCInfo(triggerLog).noquote() << "unknown intent:" << text.trimmed();
        return;
    }

    ++m_dispatched;
    dispatchIntent(m_controller, *intent);
}

} // namespace keylight
