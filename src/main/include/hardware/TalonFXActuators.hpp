#pragma once

#include "hardware/DriveActuator.hpp"
#include "hardware/RelativeAngleActuator.hpp"

#include <ctre/Phoenix.h>

namespace swerve
{
    // Falcon 500 on the integrated sensor, 2048 counts per motor turn
    class TalonFXAngleActuator : public RelativeAngleActuator
    {
    public:
        explicit TalonFXAngleActuator(int turner_adr);

        HardwareStatus configure(ActuatorSettings const &settings) override;

        units::degree_t getPosition() override;

        HardwareStatus setPosition(units::degree_t position) override;

        void setReference(units::degree_t position) override;

        void setInverted(bool inverted) override;

    private:
        TalonFX turner;
        double counts_per_degree = 2048.0;
    };

    class TalonFXDriveActuator : public DriveActuator
    {
    public:
        explicit TalonFXDriveActuator(int driver_adr);

        HardwareStatus configure(ActuatorSettings const &settings) override;

        units::meters_per_second_t getVelocity() override;

        units::meter_t getDistance() override;

        void setReference(units::meters_per_second_t velocity) override;

        void setInverted(bool inverted) override;

    private:
        TalonFX driver;
        double counts_per_meter = 2048.0;
    };
} // namespace swerve
