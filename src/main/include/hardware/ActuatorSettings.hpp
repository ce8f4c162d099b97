#pragma once

#include <units/current.h>

namespace swerve
{
    // Gains handed to the motor controller's onboard loop, never run here.
    // Native units of whichever controller receives them.
    struct PIDFGains
    {
        double kP = 0.0;
        double kI = 0.0;
        double kD = 0.0;
        double kFF = 0.0;
    };

    struct ActuatorSettings
    {
        // Output units (deg for steering, m for drive) per motor rotation
        double units_per_rotation = 1.0;
        bool inverted = false;
        bool brake_mode = true;
        units::ampere_t current_limit{40};
        PIDFGains pidf;
    };
} // namespace swerve
