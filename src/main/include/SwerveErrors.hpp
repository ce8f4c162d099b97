#pragma once

#include <stdexcept>
#include <string>

namespace swerve
{
    // Bad gear ratio, bad offset, actuator refused its setup. Thrown
    // while constructing a module, which never becomes usable.
    class ConfigurationError : public std::runtime_error
    {
    public:
        explicit ConfigurationError(std::string const &what) : std::runtime_error(what) {}
    };

    // Sensor or actuator I/O failed during calibration. The module is
    // left uncalibrated and ignores commands until calibrate() succeeds.
    class CalibrationError : public std::runtime_error
    {
    public:
        explicit CalibrationError(std::string const &what) : std::runtime_error(what) {}
    };
} // namespace swerve
