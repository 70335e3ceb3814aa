#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "hardware/notification_sink.hpp"

namespace sprout {

// Writes alerts to the log only. Used when no chat is configured.
class LogNotificationSink : public NotificationSink {
public:
    bool send(const std::string &text) override;
    bool isConfigured() const override { return true; }

    std::vector<std::string> sent() const;

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_sent;
};

} // namespace sprout
