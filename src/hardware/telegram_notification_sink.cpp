#include "hardware/telegram_notification_sink.hpp"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

#include <utility>

#include "common/logging.hpp"

namespace sprout {

TelegramNotificationSink::TelegramNotificationSink(TelegramSettings settings)
    : m_settings(std::move(settings))
{
}

bool TelegramNotificationSink::isConfigured() const
{
    return !m_settings.botToken.empty() && !m_settings.chatId.empty();
}

bool TelegramNotificationSink::send(const std::string &text)
{
    if (!isConfigured()) {
        return false;
    }

    const QUrl url(QStringLiteral("https://api.telegram.org/bot%1/sendMessage")
                       .arg(QString::fromStdString(m_settings.botToken)));
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader,
                      QStringLiteral("application/json"));

    const nlohmann::json body = {
        {"chat_id", m_settings.chatId},
        {"text", text}
    };

    // The control loop thread has no running event loop of its own.
    QNetworkAccessManager manager;
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);

    QNetworkReply *reply = manager.post(request, QByteArray::fromStdString(body.dump()));
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timer.start(m_settings.timeoutSeconds * 1000);
    loop.exec();

    bool delivered = false;
    QString error;
    if (!reply->isFinished()) {
        reply->abort();
        error = QStringLiteral("timeout");
    } else if (reply->error() != QNetworkReply::NoError) {
        error = reply->errorString();
    } else {
        const auto response = nlohmann::json::parse(reply->readAll().toStdString(),
                                                    nullptr, false);
        delivered = response.is_object() && response.value("ok", false);
        if (!delivered) {
            error = QStringLiteral("api_rejected");
        }
    }
    reply->deleteLater();

    if (!delivered) {
        SLOG_WARN(QStringLiteral("TelegramNotificationSink"),
                  QStringLiteral("send"),
                  QStringLiteral("notification_failed"),
                  QStringLiteral("alert_delivery"),
                  QStringLiteral("telegram_bot_api"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"error", error.toStdString()}});
    }
    return delivered;
}

} // namespace sprout
