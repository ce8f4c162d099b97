#include "hardware/TalonFXActuators.hpp"
#include "hardware/PhoenixStatus.hpp"
#include "hardware/VendorUnits.hpp"

/******************************************************************/
/*                        Private Constants                        */
/******************************************************************/

constexpr int PID_IDX = 0;
constexpr int SLOT = 0;
constexpr int CONFIG_TIMEOUT_MS = 50;

// Supply limit trips after this long above the threshold
constexpr double CURRENT_TRIGGER_TIME = 0.1; // s

/******************************************************************/
/*                       Private Functions                        */
/******************************************************************/

static TalonFXInvertType invertType(bool inverted)
{
    return inverted ? TalonFXInvertType::Clockwise : TalonFXInvertType::CounterClockwise;
}

static swerve::HardwareStatus configureTalon(TalonFX &motor, swerve::ActuatorSettings const &settings)
{
    // Always restore factory defaults - it removes gremlins
    auto const reset = swerve::fromErrorCode(motor.ConfigFactoryDefault(CONFIG_TIMEOUT_MS));
    if (!swerve::isOk(reset))
        return reset;

    motor.SetInverted(invertType(settings.inverted));
    motor.SetNeutralMode(settings.brake_mode ? NeutralMode::Brake : NeutralMode::Coast);

    double const limit = settings.current_limit.value();

    return swerve::firstError({
        motor.ConfigSelectedFeedbackSensor(TalonFXFeedbackDevice::IntegratedSensor, PID_IDX, CONFIG_TIMEOUT_MS),
        motor.ConfigSupplyCurrentLimit(SupplyCurrentLimitConfiguration{true, limit, limit, CURRENT_TRIGGER_TIME}, CONFIG_TIMEOUT_MS),
        motor.Config_kP(SLOT, settings.pidf.kP, CONFIG_TIMEOUT_MS),
        motor.Config_kI(SLOT, settings.pidf.kI, CONFIG_TIMEOUT_MS),
        motor.Config_kD(SLOT, settings.pidf.kD, CONFIG_TIMEOUT_MS),
        motor.Config_kF(SLOT, settings.pidf.kFF, CONFIG_TIMEOUT_MS),
    });
}

/******************************************************************/
/*                   Public Function Definitions                  */
/******************************************************************/

swerve::TalonFXAngleActuator::TalonFXAngleActuator(int turner_adr)
    : turner{turner_adr}
{
}

swerve::HardwareStatus swerve::TalonFXAngleActuator::configure(ActuatorSettings const &settings)
{
    counts_per_degree = talonCountsPerUnit(settings.units_per_rotation);
    return configureTalon(turner, settings);
}

units::degree_t swerve::TalonFXAngleActuator::getPosition()
{
    return units::degree_t{turner.GetSelectedSensorPosition(PID_IDX) / counts_per_degree};
}

swerve::HardwareStatus swerve::TalonFXAngleActuator::setPosition(units::degree_t position)
{
    return fromErrorCode(turner.SetSelectedSensorPosition(position.value() * counts_per_degree, PID_IDX, CONFIG_TIMEOUT_MS));
}

void swerve::TalonFXAngleActuator::setReference(units::degree_t position)
{
    turner.Set(ControlMode::Position, position.value() * counts_per_degree);
}

void swerve::TalonFXAngleActuator::setInverted(bool inverted)
{
    turner.SetInverted(invertType(inverted));
}

swerve::TalonFXDriveActuator::TalonFXDriveActuator(int driver_adr)
    : driver{driver_adr}
{
}

swerve::HardwareStatus swerve::TalonFXDriveActuator::configure(ActuatorSettings const &settings)
{
    counts_per_meter = talonCountsPerUnit(settings.units_per_rotation);
    return configureTalon(driver, settings);
}

units::meters_per_second_t swerve::TalonFXDriveActuator::getVelocity()
{
    return units::meters_per_second_t{talonToUnitsPerSecond(driver.GetSelectedSensorVelocity(PID_IDX), counts_per_meter)};
}

units::meter_t swerve::TalonFXDriveActuator::getDistance()
{
    return units::meter_t{driver.GetSelectedSensorPosition(PID_IDX) / counts_per_meter};
}

void swerve::TalonFXDriveActuator::setReference(units::meters_per_second_t velocity)
{
    driver.Set(ControlMode::Velocity, unitsPerSecondToTalon(velocity.value(), counts_per_meter));
}

void swerve::TalonFXDriveActuator::setInverted(bool inverted)
{
    driver.SetInverted(invertType(inverted));
}
