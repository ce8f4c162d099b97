#include "hardware/SparkMaxActuators.hpp"
#include "hardware/VendorUnits.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <initializer_list>

/******************************************************************/
/*                        Private Constants                        */
/******************************************************************/

constexpr auto MOTOR_TYPE = rev::CANSparkMax::MotorType::kBrushless;

// PID slot for angle and drive pid on the SparkMax
constexpr int SLOT = 0;

/******************************************************************/
/*                       Private Functions                        */
/******************************************************************/

static swerve::HardwareStatus fromREVLibError(rev::REVLibError const &error)
{
    using rev::REVLibError;

    if (error == REVLibError::kOk)
        return swerve::HardwareStatus::kOk;
    if (error == REVLibError::kTimeout)
        return swerve::HardwareStatus::kTimeout;
    if (error == REVLibError::kCANDisconnected)
        return swerve::HardwareStatus::kNotConnected;
    if (error == REVLibError::kParamInvalid)
        return swerve::HardwareStatus::kInvalidParameter;
    return swerve::HardwareStatus::kDeviceError;
}

static swerve::HardwareStatus firstRevError(std::initializer_list<rev::REVLibError> errors)
{
    for (auto const &error : errors)
    {
        auto const status = fromREVLibError(error);
        if (!swerve::isOk(status))
            return status;
    }
    return swerve::HardwareStatus::kOk;
}

static swerve::HardwareStatus configureSparkMax(rev::CANSparkMax &motor,
                                                rev::SparkMaxRelativeEncoder &encoder,
                                                rev::SparkMaxPIDController &pid,
                                                swerve::ActuatorSettings const &settings)
{
    // Always restore factory defaults - it removes gremlins
    auto const reset = fromREVLibError(motor.RestoreFactoryDefaults());
    if (!swerve::isOk(reset))
        return reset;

    motor.SetInverted(settings.inverted);

    auto const idle = settings.brake_mode ? rev::CANSparkMax::IdleMode::kBrake : rev::CANSparkMax::IdleMode::kCoast;

    auto const status = firstRevError({
        motor.SetIdleMode(idle),
        motor.SetSmartCurrentLimit(static_cast<unsigned int>(settings.current_limit.value())),
        encoder.SetPositionConversionFactor(settings.units_per_rotation), // deg or m per motor turn
        encoder.SetVelocityConversionFactor(swerve::sparkVelocityFactor(settings.units_per_rotation)),
        pid.SetP(settings.pidf.kP, SLOT),
        pid.SetI(settings.pidf.kI, SLOT),
        pid.SetD(settings.pidf.kD, SLOT),
        pid.SetFF(settings.pidf.kFF, SLOT),
    });
    if (!swerve::isOk(status))
        return status;

    // burn the motor flash
    return fromREVLibError(motor.BurnFlash());
}

// Steady state commands have no failure path, so only report the edges
static void reportReference(rev::REVLibError const &error, bool &failing, int const &id)
{
    bool const failed = error != rev::REVLibError::kOk;

    if (failed && !failing)
        fmt::print(stderr, "SparkMax {}: setReference failing\n", id);
    else if (!failed && failing)
        fmt::print(stderr, "SparkMax {}: setReference recovered\n", id);

    failing = failed;
}

/******************************************************************/
/*                   Public Function Definitions                  */
/******************************************************************/

swerve::SparkMaxAngleActuator::SparkMaxAngleActuator(int turner_adr)
    : turner{turner_adr, MOTOR_TYPE},
      encoder{turner.GetEncoder()},
      pid{turner.GetPIDController()}
{
}

swerve::HardwareStatus swerve::SparkMaxAngleActuator::configure(ActuatorSettings const &settings)
{
    return configureSparkMax(turner, encoder, pid, settings);
}

units::degree_t swerve::SparkMaxAngleActuator::getPosition()
{
    return units::degree_t{encoder.GetPosition()};
}

swerve::HardwareStatus swerve::SparkMaxAngleActuator::setPosition(units::degree_t position)
{
    return fromREVLibError(encoder.SetPosition(position.value()));
}

void swerve::SparkMaxAngleActuator::setReference(units::degree_t position)
{
    reportReference(pid.SetReference(position.value(), rev::CANSparkMax::ControlType::kPosition, SLOT),
                    reference_failing,
                    turner.GetDeviceId());
}

void swerve::SparkMaxAngleActuator::setInverted(bool inverted)
{
    turner.SetInverted(inverted);
}

swerve::SparkMaxDriveActuator::SparkMaxDriveActuator(int driver_adr)
    : driver{driver_adr, MOTOR_TYPE},
      encoder{driver.GetEncoder()},
      pid{driver.GetPIDController()}
{
}

swerve::HardwareStatus swerve::SparkMaxDriveActuator::configure(ActuatorSettings const &settings)
{
    return configureSparkMax(driver, encoder, pid, settings);
}

units::meters_per_second_t swerve::SparkMaxDriveActuator::getVelocity()
{
    return units::meters_per_second_t{encoder.GetVelocity()};
}

units::meter_t swerve::SparkMaxDriveActuator::getDistance()
{
    return units::meter_t{encoder.GetPosition()};
}

void swerve::SparkMaxDriveActuator::setReference(units::meters_per_second_t velocity)
{
    reportReference(pid.SetReference(velocity.value(), rev::CANSparkMax::ControlType::kVelocity, SLOT),
                    reference_failing,
                    driver.GetDeviceId());
}

void swerve::SparkMaxDriveActuator::setInverted(bool inverted)
{
    driver.SetInverted(inverted);
}
