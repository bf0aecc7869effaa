#include "keylight_http.h"

#include <memory>
#include <utility>

#include <QEventLoop>
#include <QLoggingCategory>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>
#if QT_CONFIG(ssl)
#include <QSslConfiguration>
#include <QSslSocket>
#endif

Q_LOGGING_CATEGORY(httpLog, "keylight.http");

namespace keylight {

namespace {

int timeoutFor(const ConnectionSettings &settings, int timeoutMs)
{
    if (timeoutMs > 0)
        return timeoutMs;
    return settings.timeoutMs > 0 ? settings.timeoutMs : kDefaultTimeoutMs;
}

// Transport errors win over the status line; anything outside 2xx fails.
HttpResult finishedResult(QNetworkReply *reply)
{
    HttpResult result;
    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();
    if (reply->error() != QNetworkReply::NoError)
        result.error = reply->errorString();
    else if (result.statusCode < 200 || result.statusCode >= 300)
        result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
    else
        result.ok = true;
    return result;
}

} // namespace

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

QString HttpClient::effectiveHost(const ConnectionSettings &settings)
{
    const QString host = settings.host.trimmed();
    return host.isEmpty() ? settings.ip.trimmed() : host;
}

QUrl HttpClient::lightUrl(const ConnectionSettings &settings, const QString &path, QString *error)
{
    const QString host = effectiveHost(settings);
    if (host.isEmpty()) {
        if (error)
            *error = QStringLiteral("Light host is empty");
        return QUrl();
    }

    QUrl url;
    url.setScheme(settings.useTls ? QStringLiteral("https") : QStringLiteral("http"));
    url.setHost(host);
    url.setPort(settings.port > 0 ? settings.port : kDefaultPort);
    if (path.startsWith(QLatin1Char('/')))
        url.setPath(path);
    else
        url.setPath(QStringLiteral("/") + path);
    if (!url.isValid()) {
        if (error)
            *error = QStringLiteral("Invalid light URL: %1").arg(url.errorString());
        return QUrl();
    }
    return url;
}

HttpResult HttpClient::get(const ConnectionSettings &settings, const QString &path, int timeoutMs) const
{
    HttpResult result;
    bool finished = false;
    QEventLoop loop;

    const bool started = send(settings, QByteArrayLiteral("GET"), path, {}, timeoutMs,
                              [&](const HttpResult &reply) {
                                  result = reply;
                                  finished = true;
                                  loop.quit();
                              },
                              &result.error);
    if (started && !finished)
        loop.exec();
    return result;
}

bool HttpClient::putJsonAsync(const ConnectionSettings &settings,
                              const QString &path,
                              const QByteArray &payload,
                              Completion done,
                              QString *error) const
{
    return send(settings, QByteArrayLiteral("PUT"), path, payload, 0, std::move(done), error);
}

bool HttpClient::send(const ConnectionSettings &settings,
                      const QByteArray &method,
                      const QString &path,
                      const QByteArray &payload,
                      int timeoutMs,
                      Completion done,
                      QString *error) const
{
    if (!m_manager) {
        if (error)
            *error = QStringLiteral("Network manager unavailable");
        return false;
    }

    const QUrl url = lightUrl(settings, path, error);
    if (url.isEmpty())
        return false;

    QNetworkRequest request(url);
    request.setRawHeader("Accept", "application/json");
    request.setRawHeader("User-Agent", "keylight-ctl/1.0");
    if (!payload.isEmpty())
        request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
#if QT_CONFIG(ssl)
    // Lights serve a self-signed certificate when TLS is enabled at all.
    if (settings.useTls) {
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
        request.setSslConfiguration(ssl);
    }
#endif

    QNetworkReply *reply = method == "GET" ? m_manager->get(request)
                                           : m_manager->sendCustomRequest(request, method, payload);
    if (!reply) {
        if (error)
            *error = QStringLiteral("Failed to create network request");
        return false;
    }

    // Parented to the reply so it dies with it.
    auto timedOut = std::make_shared<bool>(false);
    auto *timer = new QTimer(reply);
    timer->setSingleShot(true);
    QObject::connect(timer, &QTimer::timeout, reply, [reply, timedOut]() {
        *timedOut = true;
        reply->abort();
    });
    timer->start(timeoutFor(settings, timeoutMs));

    QObject::connect(reply, &QNetworkReply::finished, reply,
                     [reply, timer, timedOut, method, done = std::move(done)]() {
        timer->stop();
        HttpResult result;
        if (*timedOut) {
            qCDebug(httpLog) << method << reply->url().toString() << "timed out";
            result.error = QStringLiteral("Request timed out");
        } else {
            result = finishedResult(reply);
        }
        reply->deleteLater();
        if (done)
            done(result);
    });

    if (error)
        error->clear();
    return true;
}

} // namespace keylight
