#pragma once

#include "hardware/DriveActuator.hpp"
#include "hardware/RelativeAngleActuator.hpp"

#include <rev/CANSparkMax.h>

namespace swerve
{
    /**
     * NEO on a SparkMax, position mode on the internal encoder. The
     * encoder can't be inverted in brushless mode, the motor is instead.
     *
     * Conversion factors live on the SparkMax so it reports deg and
     * deg/s directly.
     */
    class SparkMaxAngleActuator : public RelativeAngleActuator
    {
    public:
        explicit SparkMaxAngleActuator(int turner_adr);

        HardwareStatus configure(ActuatorSettings const &settings) override;

        units::degree_t getPosition() override;

        HardwareStatus setPosition(units::degree_t position) override;

        void setReference(units::degree_t position) override;

        void setInverted(bool inverted) override;

    private:
        rev::CANSparkMax turner;
        rev::SparkMaxRelativeEncoder encoder;
        rev::SparkMaxPIDController pid;
        bool reference_failing = false;
    };

    // Velocity mode, conversion factors give m and m/s
    class SparkMaxDriveActuator : public DriveActuator
    {
    public:
        explicit SparkMaxDriveActuator(int driver_adr);

        HardwareStatus configure(ActuatorSettings const &settings) override;

        units::meters_per_second_t getVelocity() override;

        units::meter_t getDistance() override;

        void setReference(units::meters_per_second_t velocity) override;

        void setInverted(bool inverted) override;

    private:
        rev::CANSparkMax driver;
        rev::SparkMaxRelativeEncoder encoder;
        rev::SparkMaxPIDController pid;
        bool reference_failing = false;
    };
} // namespace swerve
