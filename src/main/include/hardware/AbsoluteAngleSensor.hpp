#pragma once

#include "hardware/HardwareStatus.hpp"

#include <units/angle.h>
#include <units/time.h>

#include <optional>

namespace swerve
{
    /**
     * Absolute encoder on the steering axis. Position is bounded to
     * [-180, 180) and survives power cycles; the magnet offset lives in
     * the sensor's own persistent configuration.
     */
    class AbsoluteAngleSensor
    {
    public:
        virtual ~AbsoluteAngleSensor() = default;

        // std::nullopt when the sensor did not answer
        virtual std::optional<units::degree_t> getAbsolutePosition() = 0;

        virtual std::optional<units::degree_t> getMagnetOffset() = 0;

        virtual HardwareStatus setMagnetOffset(units::degree_t offset, units::millisecond_t timeout) = 0;
    };
} // namespace swerve
