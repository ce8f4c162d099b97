#pragma once

namespace swerve
{
    // Falcon 500 integrated sensor
    constexpr double TALONFX_COUNTS_PER_ROTATION = 2048;

    // Talon velocity is reported per 100 ms
    constexpr double TALONFX_VELOCITY_PERIODS_PER_SECOND = 10;

    // units_per_rotation is deg or m per motor rotation
    constexpr double talonCountsPerUnit(double units_per_rotation)
    {
        return TALONFX_COUNTS_PER_ROTATION / units_per_rotation;
    }

    constexpr double talonToUnitsPerSecond(double counts_per_100ms, double counts_per_unit)
    {
        return counts_per_100ms * TALONFX_VELOCITY_PERIODS_PER_SECOND / counts_per_unit;
    }

    constexpr double unitsPerSecondToTalon(double units_per_second, double counts_per_unit)
    {
        return units_per_second * counts_per_unit / TALONFX_VELOCITY_PERIODS_PER_SECOND;
    }

    // SparkMax reports velocity in rpm
    constexpr double sparkVelocityFactor(double units_per_rotation)
    {
        return units_per_rotation / 60.0;
    }
} // namespace swerve
