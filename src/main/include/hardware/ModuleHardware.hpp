#pragma once

#include "hardware/AbsoluteAngleSensor.hpp"
#include "hardware/DriveActuator.hpp"
#include "hardware/RelativeAngleActuator.hpp"

#include <memory>

namespace swerve
{
    struct ModuleCanIds
    {
        int driver_adr;
        int turner_adr;
        int cancoder_adr;
    };

    enum class MotorController
    {
        TALON_FX,
        SPARK_MAX
    };

    /**
     * The physical devices of one wheel. Owns them; SwerveModule only
     * borrows, so this must outlive the module built on top of it.
     */
    struct ModuleHardware
    {
        std::unique_ptr<AbsoluteAngleSensor> absEncoder;
        std::unique_ptr<RelativeAngleActuator> angleMotor;
        std::unique_ptr<DriveActuator> driveMotor;

        // CANCoder on the steering axis, motors picked by controller
        static ModuleHardware create(ModuleCanIds const &ids, MotorController const &controller);
    };
} // namespace swerve
