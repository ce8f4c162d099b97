#pragma once

#include "hardware/ActuatorSettings.hpp"

#include <units/angle.h>
#include <units/current.h>
#include <units/length.h>

#include <string>

namespace swerve
{
    // Shared by all four modules
    struct DrivetrainConfig
    {
        units::meter_t wheel_diameter{0.1016}; // 4 in
        double drive_gear_ratio = 8.16;        // motor turns per wheel turn
        double steering_gear_ratio = 12.8;     // motor turns per module turn

        PIDFGains angle_pidf;
        PIDFGains drive_pidf;

        units::ampere_t angle_current_limit{20};
        units::ampere_t drive_current_limit{40};

        // Flip the wheel instead of steering past 90 deg. Off unless
        // the integrator opts in.
        bool optimize_reversal = false;

        // Throws ConfigurationError
        void validate() const;

        // Steering encoder scale, deg per motor rotation
        double degreesPerMotorRotation() const;

        // Drive encoder scale, m of wheel travel per motor rotation
        double metersPerMotorRotation() const;
    };

    // Per wheel
    struct ModuleConfig
    {
        std::string name;

        // Written into the absolute sensor, [-180, 180]
        units::degree_t magnet_offset{0};

        bool invert_angle_command = false;
        bool invert_angle_motor = false;
        bool invert_drive_motor = false;

        // Location relative to robot centre, for kinematics above us
        units::meter_t pos_x{0};
        units::meter_t pos_y{0};

        // Throws ConfigurationError
        void validate() const;
    };
} // namespace swerve
