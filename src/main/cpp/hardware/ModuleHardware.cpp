#include "hardware/ModuleHardware.hpp"
#include "hardware/CANCoderAngleSensor.hpp"
#include "hardware/SparkMaxActuators.hpp"
#include "hardware/TalonFXActuators.hpp"

swerve::ModuleHardware swerve::ModuleHardware::create(ModuleCanIds const &ids, MotorController const &controller)
{
    ModuleHardware hardware;
    hardware.absEncoder = std::make_unique<CANCoderAngleSensor>(ids.cancoder_adr);

    switch (controller)
    {
    case MotorController::SPARK_MAX:
        hardware.angleMotor = std::make_unique<SparkMaxAngleActuator>(ids.turner_adr);
        hardware.driveMotor = std::make_unique<SparkMaxDriveActuator>(ids.driver_adr);
        break;
    case MotorController::TALON_FX:
    default:
        hardware.angleMotor = std::make_unique<TalonFXAngleActuator>(ids.turner_adr);
        hardware.driveMotor = std::make_unique<TalonFXDriveActuator>(ids.driver_adr);
        break;
    }

    return hardware;
}
