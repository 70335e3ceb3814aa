#pragma once

#include <optional>
#include <string>

namespace sprout {

// Still-image capture device.
class Capturer {
public:
    virtual ~Capturer() = default;

    virtual bool initialize() = 0;
    // Writes one image to `path`, creating parent directories. Returns the
    // written path, or nullopt when nothing was captured.
    virtual std::optional<std::string> capture(const std::string &path) = 0;
    virtual void release() = 0;
    virtual bool isSimulated() const = 0;
};

} // namespace sprout
