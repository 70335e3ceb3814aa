#pragma once

#include <string>

namespace sprout {

class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    // Best effort; returns false when the message was not delivered.
    virtual bool send(const std::string &text) = 0;
    virtual bool isConfigured() const = 0;
};

} // namespace sprout
