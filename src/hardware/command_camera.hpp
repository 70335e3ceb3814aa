#pragma once

#include <QString>

#include "common/config.hpp"
#include "hardware/capturer.hpp"

namespace sprout {

// Camera driven by an external still-capture command (rpicam-still by
// default). Each capture runs the command once with a timeout.
class CommandCamera : public Capturer {
public:
    explicit CommandCamera(CameraSettings settings);

    bool initialize() override;
    std::optional<std::string> capture(const std::string &path) override;
    void release() override;
    bool isSimulated() const override { return false; }

private:
    CameraSettings m_settings;
    QString m_program;
};

} // namespace sprout
