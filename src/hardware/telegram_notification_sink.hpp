#pragma once

#include "common/config.hpp"
#include "hardware/notification_sink.hpp"

namespace sprout {

// Sends alert text to a Telegram chat through the Bot API sendMessage call.
// send() blocks the calling thread until the request finishes or times out.
class TelegramNotificationSink : public NotificationSink {
public:
    explicit TelegramNotificationSink(TelegramSettings settings);

    bool send(const std::string &text) override;
    bool isConfigured() const override;

private:
    TelegramSettings m_settings;
};

} // namespace sprout
