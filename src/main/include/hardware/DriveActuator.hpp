#pragma once

#include "hardware/ActuatorSettings.hpp"
#include "hardware/HardwareStatus.hpp"

#include <units/length.h>
#include <units/velocity.h>

namespace swerve
{
    // Drive motor plus encoder, scaled to linear wheel travel
    class DriveActuator
    {
    public:
        virtual ~DriveActuator() = default;

        virtual HardwareStatus configure(ActuatorSettings const &settings) = 0;

        virtual units::meters_per_second_t getVelocity() = 0;

        virtual units::meter_t getDistance() = 0;

        virtual void setReference(units::meters_per_second_t velocity) = 0;

        virtual void setInverted(bool inverted) = 0;
    };
} // namespace swerve
