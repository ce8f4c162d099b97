#include "SwerveModule.hpp"
#include "AngleMath.hpp"
#include "Constants.hpp"
#include "SwerveErrors.hpp"

#include <frc/Timer.h>

#include <fmt/core.h>
#include <fmt/format.h>

#include <units/math.h>

#include <cstdio>

/******************************************************************/
/*                        Private Constants                        */
/******************************************************************/

// Stored offsets come back through the sensor's fixed point config
constexpr units::degree_t OFFSET_TOLERANCE = 0.001_deg;

constexpr char const *TELEMETRY_PREFIX = "/MK3-";

/******************************************************************/
/*                       Private Functions                        */
/******************************************************************/

static void checkConfigured(swerve::HardwareStatus const &status, std::string const &module, char const *motor)
{
    if (!swerve::isOk(status))
        throw swerve::ConfigurationError{fmt::format("{}: {} rejected its configuration ({})", module, motor, swerve::toString(status))};
}

/******************************************************************/
/*                   Public Function Definitions                  */
/******************************************************************/

swerve::SwerveModule::SwerveModule(DrivetrainConfig const &drivetrain,
                                   ModuleConfig const &config,
                                   AbsoluteAngleSensor &absEncoder,
                                   RelativeAngleActuator &angleMotor,
                                   DriveActuator &driveMotor)
    : absEncoder{absEncoder},
      angleMotor{angleMotor},
      driveMotor{driveMotor},
      name{config.name},
      magnet_offset{config.magnet_offset},
      angleCmdInvert{config.invert_angle_command ? -1.0 : 1.0}, // account for command sign differences
      optimize_reversal{drivetrain.optimize_reversal},
      pos_x{config.pos_x},
      pos_y{config.pos_y}
{
    drivetrain.validate();
    config.validate();

    // Steering encoder in deg, drive encoder in m
    ActuatorSettings angle;
    angle.units_per_rotation = drivetrain.degreesPerMotorRotation();
    angle.inverted = config.invert_angle_motor;
    angle.current_limit = drivetrain.angle_current_limit;
    angle.pidf = drivetrain.angle_pidf;
    checkConfigured(angleMotor.configure(angle), name, "angle motor");

    ActuatorSettings drive;
    drive.units_per_rotation = drivetrain.metersPerMotorRotation();
    drive.inverted = config.invert_drive_motor;
    drive.current_limit = drivetrain.drive_current_limit;
    drive.pidf = drivetrain.drive_pidf;
    checkConfigured(driveMotor.configure(drive), name, "drive motor");

    calibrate();
}

bool swerve::SwerveModule::applyMagnetOffset(units::degree_t const &offset)
{
    bool const written = writeMagnetOffset(offset);

    // the steering register was seeded in the old sensor frame
    if (written)
        calibrate();

    return written;
}

void swerve::SwerveModule::calibrate()
{
    calibration = CalibrationState::UNCALIBRATED;
    refusal_reported = false;

    try
    {
        writeMagnetOffset(magnet_offset);

        auto const absolute = absEncoder.getAbsolutePosition();
        if (!absolute)
            throw CalibrationError{fmt::format("{}: absolute encoder did not report a position", name)};

        auto const seed = angleCmdInvert * *absolute;

        auto const status = angleMotor.setPosition(seed);
        if (!isOk(status))
            throw CalibrationError{fmt::format("{}: seeding angle encoder to {} deg failed ({})", name, seed.value(), toString(status))};

        snapshot.external_angle = *absolute;
        snapshot.internal_angle = seed * angleCmdInvert;

        fmt::print("{}: calibrated, absolute {:.2f} deg, angle encoder {:.2f} deg\n", name, absolute->value(), seed.value());
    }
    catch (CalibrationError const &e)
    {
        fmt::print(stderr, "{}\n", e.what());
        throw;
    }

    calibration = CalibrationState::CALIBRATED;
}

void swerve::SwerveModule::periodic()
{
    ModuleSnapshot measured = snapshot;

    measured.internal_angle = angleMotor.getPosition() * angleCmdInvert;

    // Keep the last good absolute angle on a missed read
    if (auto const absolute = absEncoder.getAbsolutePosition())
        measured.external_angle = *absolute;

    measured.velocity = driveMotor.getVelocity();
    measured.distance = driveMotor.getDistance();

    snapshot = measured;

    if (telemetry != nullptr)
        telemetry->publish(telemetry_prefix, snapshot);
}

void swerve::SwerveModule::setDesiredState(frc::SwerveModuleState const &desired)
{
    if (!isCalibrated())
    {
        if (!refusal_reported)
            fmt::print(stderr, "{}: not calibrated, ignoring commands until calibrate() succeeds\n", name);
        refusal_reported = true;
        return;
    }

    auto const state = optimize_reversal ? AngleMath::optimize(desired, snapshot.internal_angle) : desired;

    snapshot.target_angle = state.angle.Degrees();
    snapshot.target_velocity = state.speed;

    // figure out how far we need to move, target - current, bounded +/-180
    auto delta = AngleMath::delta360(snapshot.target_angle, snapshot.internal_angle);

    // if we aren't moving, keep the wheels pointed where they are
    if (units::math::abs(state.speed) < DriveTrain::STOP_SPEED)
        delta = 0_deg;

    // internal angle isn't range bound, neither is the target
    angleMotor.setReference(angleCmdInvert * (snapshot.internal_angle + delta));

    driveMotor.setReference(state.speed);
}

swerve::SwerveModule &swerve::SwerveModule::setTelemetry(ModuleTelemetry *sink, std::string const &prefix)
{
    telemetry_prefix = TELEMETRY_PREFIX + prefix;

    if (sink != nullptr)
        sink->attach(telemetry_prefix);

    telemetry = sink;
    return *this;
}

void swerve::SwerveModule::setInvertAngleCommand(bool invert)
{
    angleCmdInvert = invert ? -1.0 : 1.0;

    // the stored encoder position means something else now
    calibrate();
}

void swerve::SwerveModule::setInvertAngleMotor(bool invert)
{
    angleMotor.setInverted(invert);
}

void swerve::SwerveModule::setInvertDriveMotor(bool invert)
{
    driveMotor.setInverted(invert);
}

frc::SwerveModuleState swerve::SwerveModule::getState() const
{
    return {snapshot.velocity, frc::Rotation2d{snapshot.internal_angle}};
}

bool swerve::SwerveModule::isNearPositionLimit() const
{
    return units::math::abs(snapshot.internal_angle) >= DriveTrain::POSITION_LIMIT;
}

/******************************************************************/
/*                   Private Function Definitions                 */
/******************************************************************/

bool swerve::SwerveModule::writeMagnetOffset(units::degree_t const &offset)
{
    if (units::math::abs(offset) > 180_deg)
        throw ConfigurationError{fmt::format("{}: magnet offset {} deg is outside [-180, 180]", name, offset.value())};

    auto const stored = absEncoder.getMagnetOffset();
    if (!stored)
        throw CalibrationError{fmt::format("{}: could not read the absolute encoder configuration", name)};

    magnet_offset = offset;

    if (units::math::abs(*stored - offset) < OFFSET_TOLERANCE)
        return false;

    auto const status = absEncoder.setMagnetOffset(offset, DriveTrain::CONFIG_TIMEOUT);
    if (!isOk(status))
        throw CalibrationError{fmt::format("{}: writing magnet offset {} deg failed ({})", name, offset.value(), toString(status))};

    fmt::print("{}: magnet offset {:.3f} -> {:.3f} deg\n", name, stored->value(), offset.value());

    // Absolute position reads right after a config write are garbage
    frc::Wait(DriveTrain::CONFIG_SETTLE_TIME);

    return true;
}
