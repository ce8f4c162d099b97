#include "Constants.hpp"

/******************************************************************/
/*                        Private Constants                        */
/******************************************************************/

// Position mode on the steering motor, deg
constexpr swerve::PIDFGains ANGLE_PIDF{0.01, 0.0, 0.0, 0.0};

// Velocity mode on the drive motor, m/s
constexpr swerve::PIDFGains DRIVE_PIDF{0.05, 0.0, 0.0, 0.21};

struct CornerConstants
{
    char const *name;
    units::degree_t magnet_offset;
    bool invert_angle_command;
    bool invert_angle_motor;
    bool invert_drive_motor;
    swerve::ModuleCanIds ids;
};

// Offsets measured with the wheels pointed forward, bevels facing left
static CornerConstants const &constantsFor(swerve::DriveTrain::Corner const &corner)
{
    using swerve::DriveTrain::Corner;

    static CornerConstants const FRONT_LEFT{"FL", -98.942_deg, true, false, false, {20, 21, 22}};
    static CornerConstants const FRONT_RIGHT{"FR", 93.867_deg, true, false, true, {23, 24, 25}};
    static CornerConstants const BACK_LEFT{"BL", -177.803_deg, true, false, false, {26, 27, 28}};
    static CornerConstants const BACK_RIGHT{"BR", 52.734_deg, true, false, true, {29, 30, 31}};

    switch (corner)
    {
    case Corner::FRONT_LEFT:
        return FRONT_LEFT;
    case Corner::FRONT_RIGHT:
        return FRONT_RIGHT;
    case Corner::BACK_LEFT:
        return BACK_LEFT;
    case Corner::BACK_RIGHT:
    default:
        return BACK_RIGHT;
    }
}

/******************************************************************/
/*                   Public Function Definitions                  */
/******************************************************************/

swerve::DrivetrainConfig swerve::DriveTrain::drivetrainConfig()
{
    DrivetrainConfig config;
    config.wheel_diameter = WHEEL_DIAMETER;
    config.drive_gear_ratio = DRIVE_GEAR_RATIO;
    config.steering_gear_ratio = STEERING_GEAR_RATIO;
    config.angle_pidf = ANGLE_PIDF;
    config.drive_pidf = DRIVE_PIDF;
    return config;
}

swerve::ModuleConfig swerve::DriveTrain::moduleConfig(Corner const &corner)
{
    auto const &constants = constantsFor(corner);

    ModuleConfig config;
    config.name = constants.name;
    config.magnet_offset = constants.magnet_offset;
    config.invert_angle_command = constants.invert_angle_command;
    config.invert_angle_motor = constants.invert_angle_motor;
    config.invert_drive_motor = constants.invert_drive_motor;

    // +x forward, +y left
    bool const front = corner == Corner::FRONT_LEFT || corner == Corner::FRONT_RIGHT;
    bool const left = corner == Corner::FRONT_LEFT || corner == Corner::BACK_LEFT;
    config.pos_x = front ? WHEEL_BASE / 2 : -WHEEL_BASE / 2;
    config.pos_y = left ? TRACK_WIDTH / 2 : -TRACK_WIDTH / 2;

    return config;
}

swerve::ModuleCanIds swerve::DriveTrain::canIds(Corner const &corner)
{
    return constantsFor(corner).ids;
}
