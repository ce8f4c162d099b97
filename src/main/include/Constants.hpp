#pragma once

#include "ModuleConfig.hpp"
#include "hardware/ModuleHardware.hpp"

#include <units/angle.h>
#include <units/length.h>
#include <units/time.h>
#include <units/velocity.h>

#include <array>

namespace swerve::DriveTrain
{
    /******************************************************************/
    /*                        Public Constants                        */
    /******************************************************************/

    // MK3 standard ratio, NEO + 4 in wheel
    constexpr units::meter_t WHEEL_DIAMETER = 4_in;
    constexpr double DRIVE_GEAR_RATIO = 8.16;
    constexpr double STEERING_GEAR_RATIO = 12.8;

    constexpr units::meter_t WHEEL_BASE = 21.5_in;
    constexpr units::meter_t TRACK_WIDTH = 21.5_in;

    // Absolute sensor reads are unreliable right after a config write
    constexpr units::millisecond_t CONFIG_SETTLE_TIME = 50_ms;
    constexpr units::millisecond_t CONFIG_TIMEOUT = 50_ms;

    // Below this the wheel holds its heading instead of steering
    constexpr units::meters_per_second_t STOP_SPEED = 0.01_mps;

    // float position register, 2^23 / (42 counts * 12.8) turns, minus margin
    constexpr units::degree_t POSITION_LIMIT = 15000 * 360_deg;

    enum class Corner
    {
        FRONT_LEFT,
        FRONT_RIGHT,
        BACK_LEFT,
        BACK_RIGHT
    };

    constexpr std::array<Corner, 4> CORNERS{Corner::FRONT_LEFT, Corner::FRONT_RIGHT, Corner::BACK_LEFT, Corner::BACK_RIGHT};

    /******************************************************************/
    /*                  Public Function Declarations                  */
    /******************************************************************/

    DrivetrainConfig drivetrainConfig();

    ModuleConfig moduleConfig(Corner const &corner);

    ModuleCanIds canIds(Corner const &corner);
} // namespace swerve::DriveTrain
