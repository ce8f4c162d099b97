#include "AngleMath.hpp"

#include <units/math.h>

#include <cmath>

/******************************************************************/
/*                        Private Constants                        */
/******************************************************************/

constexpr double FULL_TURN = 360.0;
constexpr double HALF_TURN = 180.0;

/******************************************************************/
/*                   Public Function Definitions                  */
/******************************************************************/

units::degree_t swerve::AngleMath::wrap180(units::degree_t const &angle)
{
    double wrapped = std::fmod(angle.value() + HALF_TURN, FULL_TURN);

    if (wrapped < 0)
        wrapped += FULL_TURN;

    // fmod of a tiny negative plus a full turn can round up to exactly 360
    if (wrapped >= FULL_TURN)
        wrapped -= FULL_TURN;

    return units::degree_t{wrapped - HALF_TURN};
}

units::degree_t swerve::AngleMath::delta360(units::degree_t const &target, units::degree_t const &current)
{
    return wrap180(target - current);
}

frc::SwerveModuleState swerve::AngleMath::optimize(frc::SwerveModuleState const &desired, units::degree_t const &current)
{
    auto const delta = delta360(desired.angle.Degrees(), current);

    if (units::math::abs(delta) <= 90_deg)
        return desired;

    return {-desired.speed, frc::Rotation2d{desired.angle.Degrees() + 180_deg}};
}
