#include "ModuleConfig.hpp"
#include "SwerveErrors.hpp"

#include <fmt/format.h>

#include <wpi/numbers>

#include <cmath>

/******************************************************************/
/*                       Private Functions                        */
/******************************************************************/

static bool isPositive(double const &value)
{
    return std::isfinite(value) && value > 0.0;
}

/******************************************************************/
/*                   Public Function Definitions                  */
/******************************************************************/

void swerve::DrivetrainConfig::validate() const
{
    if (!isPositive(wheel_diameter.value()))
        throw ConfigurationError{fmt::format("wheel diameter must be positive, got {} m", wheel_diameter.value())};

    if (!isPositive(drive_gear_ratio))
        throw ConfigurationError{fmt::format("drive gear ratio must be positive, got {}", drive_gear_ratio)};

    if (!isPositive(steering_gear_ratio))
        throw ConfigurationError{fmt::format("steering gear ratio must be positive, got {}", steering_gear_ratio)};

    if (!isPositive(angle_current_limit.value()) || !isPositive(drive_current_limit.value()))
        throw ConfigurationError{"current limits must be positive"};
}

double swerve::DrivetrainConfig::degreesPerMotorRotation() const
{
    return 360.0 / steering_gear_ratio;
}

double swerve::DrivetrainConfig::metersPerMotorRotation() const
{
    return wpi::numbers::pi * wheel_diameter.value() / drive_gear_ratio;
}

void swerve::ModuleConfig::validate() const
{
    if (name.empty())
        throw ConfigurationError{"module name must not be empty"};

    auto const offset = magnet_offset.value();
    if (!std::isfinite(offset) || std::abs(offset) > 180.0)
        throw ConfigurationError{fmt::format("{}: magnet offset {} deg is outside [-180, 180]", name, offset)};
}
