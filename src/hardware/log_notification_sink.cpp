#include "hardware/log_notification_sink.hpp"

#include "common/logging.hpp"

namespace sprout {

bool LogNotificationSink::send(const std::string &text)
{
    SLOG_WARN(QStringLiteral("LogNotificationSink"),
              QStringLiteral("send"),
              QStringLiteral("alert"),
              QStringLiteral("alert_delivery"),
              QStringLiteral("log_only"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"message", text}});

    std::lock_guard<std::mutex> lock(m_mutex);
    m_sent.push_back(text);
    return true;
}

std::vector<std::string> LogNotificationSink::sent() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sent;
}

} // namespace sprout
