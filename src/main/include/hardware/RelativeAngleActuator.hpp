#pragma once

#include "hardware/ActuatorSettings.hpp"
#include "hardware/HardwareStatus.hpp"

#include <units/angle.h>

namespace swerve
{
    /**
     * Steering motor plus its built-in relative encoder. Position is
     * unbounded: it keeps counting across full turns and is only ever
     * reset through setPosition() during calibration.
     */
    class RelativeAngleActuator
    {
    public:
        virtual ~RelativeAngleActuator() = default;

        virtual HardwareStatus configure(ActuatorSettings const &settings) = 0;

        virtual units::degree_t getPosition() = 0;

        virtual HardwareStatus setPosition(units::degree_t position) = 0;

        // Closed loop position command, same frame as getPosition()
        virtual void setReference(units::degree_t position) = 0;

        virtual void setInverted(bool inverted) = 0;
    };
} // namespace swerve
