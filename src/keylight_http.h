#pragma once

#include <functional>

#include <QByteArray>
#include <QString>

class QNetworkAccessManager;
class QUrl;

namespace keylight {

inline constexpr int kDefaultPort = 9123;
inline constexpr int kDefaultTimeoutMs = 5000;

struct ConnectionSettings {
    QString host;
    QString ip;
    int port = kDefaultPort;
    bool useTls = false;
    int timeoutMs = kDefaultTimeoutMs;
};

struct HttpResult {
    bool ok = false;
    int statusCode = 0;
    QByteArray payload;
    QString error;
};

class HttpClient
{
public:
    using Completion = std::function<void(const HttpResult &)>;

    explicit HttpClient(QNetworkAccessManager *manager);

    // Blocks in a local event loop until the light answers or the timeout hits.
    HttpResult get(const ConnectionSettings &settings, const QString &path, int timeoutMs = 0) const;

    // Returns false without invoking done when the request could not be
    // created. Otherwise done runs exactly once from the event loop.
    bool putJsonAsync(const ConnectionSettings &settings,
                      const QString &path,
                      const QByteArray &payload,
                      Completion done,
                      QString *error = nullptr) const;

    static QString effectiveHost(const ConnectionSettings &settings);
    static QUrl lightUrl(const ConnectionSettings &settings, const QString &path, QString *error = nullptr);

private:
    bool send(const ConnectionSettings &settings,
              const QByteArray &method,
              const QString &path,
              const QByteArray &payload,
              int timeoutMs,
              Completion done,
              QString *error) const;

    QNetworkAccessManager *m_manager = nullptr;
};

} // namespace keylight
