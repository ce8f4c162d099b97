#pragma once

#include <frc/kinematics/SwerveModuleState.h>

#include <units/angle.h>

namespace swerve::AngleMath
{
    /******************************************************************/
    /*                  Public Function Declarations                  */
    /******************************************************************/

    // Shortest signed rotation that takes current to an angle congruent
    // to target. current may be unbounded (many turns). Result is in
    // [-180, 180); an exact half turn resolves to -180.
    units::degree_t delta360(units::degree_t const &target, units::degree_t const &current);

    // Wraps any angle into [-180, 180)
    units::degree_t wrap180(units::degree_t const &angle);

    // Reverse the wheel instead of steering more than a quarter turn.
    // Returns the heading 180 deg away with the speed negated when that
    // heading is closer to current.
    frc::SwerveModuleState optimize(frc::SwerveModuleState const &desired, units::degree_t const &current);
} // namespace swerve::AngleMath
