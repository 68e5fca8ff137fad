#pragma once

#include <stdexcept>
#include <string>

namespace astro_compute {

class AstroComputeError : public std::runtime_error {
public:
    explicit AstroComputeError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public AstroComputeError {
public:
    explicit ConfigError(const std::string& message)
        : AstroComputeError("Config error: " + message) {}
};

class ValidationError : public AstroComputeError {
public:
    explicit ValidationError(const std::string& message)
        : AstroComputeError("Validation error: " + message) {}
};

class IOError : public AstroComputeError {
public:
    explicit IOError(const std::string& message)
        : AstroComputeError("I/O error: " + message) {}
};

// Device path cannot be used (no platform, no device, build failure)
class DeviceError : public AstroComputeError {
public:
    explicit DeviceError(const std::string& message, int code = 0)
        : AstroComputeError("Device error: " + message +
                            (code != 0 ? " (code " + std::to_string(code) + ")" : "")),
          code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

// A submitted dispatch failed (enqueue, device lost, readback)
class DispatchError : public AstroComputeError {
public:
    explicit DispatchError(const std::string& message)
        : AstroComputeError("Dispatch error: " + message) {}
};

} // namespace astro_compute
