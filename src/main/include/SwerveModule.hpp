#pragma once

#include "ModuleConfig.hpp"
#include "ModuleTelemetry.hpp"
#include "hardware/AbsoluteAngleSensor.hpp"
#include "hardware/DriveActuator.hpp"
#include "hardware/RelativeAngleActuator.hpp"

#include <frc/geometry/Rotation2d.h>
#include <frc/geometry/Translation2d.h>
#include <frc/kinematics/SwerveModuleState.h>

#include <string>

namespace swerve
{
    /**
     * One steered and driven wheel.
     *
     * Steering runs in position mode on the motor's relative encoder, which
     * is never wrapped. A command adds the shortest delta (at most half a
     * turn) to the current unbounded angle, e.g. a heading of 10 deg with
     * the wheel at 710 deg becomes a reference of 730 deg.
     *
     * The absolute sensor seeds the relative position at calibration and
     * is otherwise only read for diagnostics.
     *
     * The sensor and actuators are borrowed and must outlive the module.
     */
    class SwerveModule
    {
    public:
        /******************************************************************/
        /*                  Public Function Declarations                  */
        /******************************************************************/

        enum class CalibrationState
        {
            UNCALIBRATED,
            CALIBRATED
        };

        // Configures both motors, applies the magnet offset and calibrates.
        // Throws ConfigurationError or CalibrationError.
        SwerveModule(DrivetrainConfig const &drivetrain,
                     ModuleConfig const &config,
                     AbsoluteAngleSensor &absEncoder,
                     RelativeAngleActuator &angleMotor,
                     DriveActuator &driveMotor);

        // Writes the offset into the absolute sensor if it differs from the
        // stored one, waits for the sensor to settle and recalibrates in the
        // new frame. Returns true if a write happened. Throws CalibrationError.
        bool applyMagnetOffset(units::degree_t const &offset);

        // Seeds the steering encoder from the absolute sensor.
        // Throws CalibrationError and leaves the module uncalibrated.
        void calibrate();

        // Measure everything at the same time, once per period, before
        // setDesiredState()
        void periodic();

        void setDesiredState(frc::SwerveModuleState const &state);

        // Publishes every periodic() as "/MK3-<prefix>". nullptr detaches.
        // Call before the control loop starts, the sink allocates here.
        SwerveModule &setTelemetry(ModuleTelemetry *sink, std::string const &prefix);

        std::string const &getTelemetryPrefix() const { return telemetry_prefix; }

        // Bring-up only
        void setInvertAngleCommand(bool invert);
        void setInvertAngleMotor(bool invert);
        void setInvertDriveMotor(bool invert);

        // The angle being servoed, so the real angle of the wheel (unbounded)
        units::degree_t getAngle() const { return snapshot.internal_angle; }

        // Absolute sensor, +/-180
        units::degree_t getAngleExternal() const { return snapshot.external_angle; }

        units::meters_per_second_t getVelocity() const { return snapshot.velocity; }

        frc::SwerveModuleState getState() const;

        // Drive wheel travel since power up, for odometry
        units::meter_t getDistance() const { return snapshot.distance; }

        ModuleSnapshot getSnapshot() const { return snapshot; }

        bool isCalibrated() const { return calibration == CalibrationState::CALIBRATED; }

        // Relative encoder is running out of float resolution, calibrate()
        bool isNearPositionLimit() const;

        std::string const &getName() const { return name; }

        // Allows SwerveModule to be placed into Kinematics
        operator frc::Translation2d() const { return {pos_x, pos_y}; }

        // No copies/moves should be occuring
        SwerveModule(SwerveModule const &) = delete;
        SwerveModule(SwerveModule &&) = delete;

    private:
        /******************************************************************/
        /*                  Private Function Declarations                 */
        /******************************************************************/

        // Offset write and settle wait only, no reseed
        bool writeMagnetOffset(units::degree_t const &offset);

        /******************************************************************/
        /*                        Private Variables                       */
        /******************************************************************/

        AbsoluteAngleSensor &absEncoder;
        RelativeAngleActuator &angleMotor;
        DriveActuator &driveMotor;

        std::string name;
        units::degree_t magnet_offset;
        double angleCmdInvert;
        bool optimize_reversal;
        units::meter_t pos_x;
        units::meter_t pos_y;

        CalibrationState calibration = CalibrationState::UNCALIBRATED;
        bool refusal_reported = false;

        ModuleSnapshot snapshot;

        ModuleTelemetry *telemetry = nullptr;
        std::string telemetry_prefix;
    };
} // namespace swerve
