#pragma once

#include <optional>

#include <QByteArray>
#include <QObject>
#include <QString>

class QSocketNotifier;

namespace keylight {

class LightController;

enum class IntentKind {
    TogglePower,
    Brightness,
    Temperature,
    Synchronize
};

struct Intent {
    IntentKind kind = IntentKind::TogglePower;
    QString direction;
};

// Accepts "toggle", "sync", "brightness:<dir>" and "temperature:<dir>".
// The direction is passed through unparsed; the controller drops unknown
// ones. Blank lines and lines starting with '#' yield nothing.
std::optional<Intent> parseIntent(const QString &line);

void dispatchIntent(LightController &controller, const Intent &intent);

// Line-oriented trigger source reading intents from a file descriptor
// (stdin by default). Hotkey daemons can pipe their bindings into it.
class StdinTriggerSource : public QObject
{
    Q_OBJECT
public:
    explicit StdinTriggerSource(LightController &controller, int fd = 0, QObject *parent = nullptr);
    ~StdinTriggerSource() override;

    bool start(QString *error = nullptr);
    void stop();

    // Splits data into lines and dispatches every complete one.
    void feed(const QByteArray &data);

    int dispatchedCount() const { return m_dispatched; }

signals:
    void endOfInput();

private slots:
    void onActivated();

private:
    void handleLine(const QByteArray &line);

    LightController &m_controller;
    int m_fd = 0;
    QSocketNotifier *m_notifier = nullptr;
    QByteArray m_buffer;
    int m_dispatched = 0;
};

} // namespace keylight
