#include "ModuleFixture.hpp"
#include "SwerveErrors.hpp"

#include <wpi/numbers>

#include <algorithm>
#include <cmath>

using namespace swerve;
using namespace swerve::test;

using CalibrationTest = ModuleFixture;

TEST_F(CalibrationTest, SeedsEncoderFromAbsoluteSensor)
{
    sensor.absolute = 37.5_deg;

    auto module = makeModule();

    EXPECT_TRUE(module->isCalibrated());
    EXPECT_DOUBLE_EQ(angle.position.value(), 37.5);
    EXPECT_DOUBLE_EQ(module->getAngle().value(), 37.5);
    EXPECT_DOUBLE_EQ(module->getAngleExternal().value(), 37.5);
}

TEST_F(CalibrationTest, InvertedCommandSeedsNegatedEncoder)
{
    sensor.absolute = 37.5_deg;
    config.invert_angle_command = true;

    auto module = makeModule();

    // motor frame is flipped, the servoed heading still matches the wheel
    EXPECT_DOUBLE_EQ(angle.position.value(), -37.5);
    EXPECT_DOUBLE_EQ(module->getAngle().value(), 37.5);

    module->periodic();
    EXPECT_DOUBLE_EQ(module->getAngle().value(), 37.5);
}

TEST_F(CalibrationTest, ConfiguresMotorsBeforeCalibrating)
{
    config.invert_angle_motor = true;
    config.invert_drive_motor = false;

    auto module = makeModule();

    ASSERT_GE(log.size(), 4u);
    EXPECT_EQ(log[0], "ConfigureAngle");
    EXPECT_EQ(log[1], "ConfigureDrive");
    EXPECT_EQ(log[2], "getMagnetOffset");
    EXPECT_EQ(log.back(), "setPosition");

    EXPECT_NEAR(angle.settings.units_per_rotation, 360.0 / 12.8, 1e-12);
    EXPECT_NEAR(drive.settings.units_per_rotation, wpi::numbers::pi * 0.1 / 8.0, 1e-12);
    EXPECT_TRUE(angle.settings.inverted);
    EXPECT_FALSE(drive.settings.inverted);
    EXPECT_DOUBLE_EQ(angle.settings.pidf.kP, 0.01);
    EXPECT_DOUBLE_EQ(drive.settings.pidf.kFF, 0.2);
    EXPECT_DOUBLE_EQ(angle.settings.current_limit.value(), drivetrain.angle_current_limit.value());
}

TEST_F(CalibrationTest, MatchingOffsetIsNotRewritten)
{
    sensor.stored_offset = 12.5_deg;
    config.magnet_offset = 12.5_deg;

    auto module = makeModule();

    EXPECT_EQ(sensor.offset_writes, 0);
    EXPECT_EQ(std::count(log.begin(), log.end(), "setMagnetOffset"), 0);
}

TEST_F(CalibrationTest, OffsetWriteIsIdempotent)
{
    sensor.stored_offset = 0_deg;
    config.magnet_offset = -98.9_deg;

    auto module = makeModule();
    EXPECT_EQ(sensor.offset_writes, 1);
    EXPECT_DOUBLE_EQ(sensor.stored_offset.value(), -98.9);

    EXPECT_FALSE(module->applyMagnetOffset(-98.9_deg));
    EXPECT_EQ(sensor.offset_writes, 1);

    module->calibrate();
    EXPECT_EQ(sensor.offset_writes, 1);

    EXPECT_TRUE(module->applyMagnetOffset(45_deg));
    EXPECT_FALSE(module->applyMagnetOffset(45_deg));
    EXPECT_EQ(sensor.offset_writes, 2);
}

TEST_F(CalibrationTest, RuntimeRezeroSteersInNewFrame)
{
    sensor.raw = 40_deg;
    auto module = makeModule();
    angle.follow = true;

    // a few turns in, still physically at 40
    moveWheelTo(*module, 760_deg);

    EXPECT_TRUE(module->applyMagnetOffset(-30_deg));
    EXPECT_TRUE(module->isCalibrated());
    EXPECT_DOUBLE_EQ(module->getAngleExternal().value(), 10.0);
    EXPECT_DOUBLE_EQ(module->getAngle().value(), 10.0);

    module->setDesiredState({1_mps, frc::Rotation2d{10_deg}});
    EXPECT_NEAR(angle.lastReference().value(), 10.0, 1e-9);

    module->periodic();
    module->setDesiredState({1_mps, frc::Rotation2d{-20_deg}});
    EXPECT_NEAR(angle.lastReference().value(), -20.0, 1e-9);
}

TEST_F(CalibrationTest, RuntimeRezeroWithInvertedCommand)
{
    sensor.raw = 40_deg;
    config.invert_angle_command = true;
    auto module = makeModule();

    EXPECT_TRUE(module->applyMagnetOffset(-30_deg));

    EXPECT_DOUBLE_EQ(angle.position.value(), -10.0);
    EXPECT_DOUBLE_EQ(module->getAngle().value(), 10.0);

    module->setDesiredState({1_mps, frc::Rotation2d{10_deg}});
    EXPECT_NEAR(angle.lastReference().value(), -10.0, 1e-9);
}

TEST_F(CalibrationTest, RuntimeRezeroFailureRefusesCommands)
{
    sensor.raw = 40_deg;
    auto module = makeModule();

    sensor.fail_position = true;
    EXPECT_THROW(module->applyMagnetOffset(-30_deg), CalibrationError);
    EXPECT_FALSE(module->isCalibrated());

    auto const sent = angle.references.size();
    module->setDesiredState({1_mps, frc::Rotation2d{10_deg}});
    EXPECT_EQ(angle.references.size(), sent);
}

TEST_F(CalibrationTest, WaitsForSensorToSettleAfterOffsetWrite)
{
    sensor.stored_offset = 0_deg;
    config.magnet_offset = 30_deg;

    auto module = makeModule();

    auto const write = std::find(log.begin(), log.end(), "setMagnetOffset");
    ASSERT_NE(write, log.end());
    auto const read = std::find(write, log.end(), "getAbsolutePosition");
    ASSERT_NE(read, log.end());

    EXPECT_GE(sensor.last_position_read - sensor.last_offset_write, std::chrono::milliseconds{49});
}

TEST_F(CalibrationTest, OffsetOutOfRangeIsRejected)
{
    auto module = makeModule();

    EXPECT_THROW(module->applyMagnetOffset(181_deg), ConfigurationError);
    EXPECT_EQ(sensor.offset_writes, 0);
}

TEST_F(CalibrationTest, UnreadableConfigFailsConstruction)
{
    sensor.fail_offset_read = true;

    EXPECT_THROW(makeModule(), CalibrationError);
    EXPECT_EQ(angle.set_position_calls, 0);
}

TEST_F(CalibrationTest, FailedOffsetWriteFailsConstruction)
{
    sensor.stored_offset = 0_deg;
    config.magnet_offset = 10_deg;
    sensor.write_status = HardwareStatus::kTimeout;

    EXPECT_THROW(makeModule(), CalibrationError);
    EXPECT_EQ(std::count(log.begin(), log.end(), "getAbsolutePosition"), 0);
    EXPECT_EQ(angle.set_position_calls, 0);
}

TEST_F(CalibrationTest, UnreadablePositionFailsConstruction)
{
    sensor.fail_position = true;

    EXPECT_THROW(makeModule(), CalibrationError);
    EXPECT_EQ(angle.set_position_calls, 0);
}

TEST_F(CalibrationTest, FailedSeedFailsConstruction)
{
    angle.set_position_status = HardwareStatus::kDeviceError;

    EXPECT_THROW(makeModule(), CalibrationError);
}

TEST_F(CalibrationTest, FailedRecalibrationRefusesCommands)
{
    auto module = makeModule();
    ASSERT_TRUE(module->isCalibrated());

    sensor.fail_position = true;
    EXPECT_THROW(module->calibrate(), CalibrationError);
    EXPECT_FALSE(module->isCalibrated());

    module->periodic();
    module->setDesiredState({1_mps, frc::Rotation2d{90_deg}});
    module->setDesiredState({1_mps, frc::Rotation2d{90_deg}});

    EXPECT_TRUE(angle.references.empty());
    EXPECT_TRUE(drive.references.empty());

    sensor.fail_position = false;
    sensor.absolute = -20_deg;
    module->calibrate();
    EXPECT_TRUE(module->isCalibrated());
    EXPECT_DOUBLE_EQ(module->getAngle().value(), -20.0);

    module->setDesiredState({1_mps, frc::Rotation2d{90_deg}});
    ASSERT_EQ(angle.references.size(), 1u);
    EXPECT_NEAR(angle.lastReference().value(), 90.0, 1e-9);
}

TEST_F(CalibrationTest, RecalibrationReseedsAfterDrift)
{
    sensor.absolute = 10_deg;
    auto module = makeModule();

    // many turns later, plus some slip
    moveWheelTo(*module, 3610_deg + 3_deg);
    sensor.absolute = 13_deg;

    module->calibrate();

    EXPECT_DOUBLE_EQ(angle.position.value(), 13.0);
    EXPECT_DOUBLE_EQ(module->getAngle().value(), 13.0);
}

TEST_F(CalibrationTest, FlippingCommandInversionRecalibrates)
{
    sensor.absolute = 37.5_deg;
    auto module = makeModule();
    EXPECT_DOUBLE_EQ(angle.position.value(), 37.5);

    module->setInvertAngleCommand(true);

    EXPECT_TRUE(module->isCalibrated());
    EXPECT_DOUBLE_EQ(angle.position.value(), -37.5);
    EXPECT_DOUBLE_EQ(module->getAngle().value(), 37.5);
}

TEST_F(CalibrationTest, MotorInversionOverrides)
{
    auto module = makeModule();

    module->setInvertAngleMotor(true);
    module->setInvertDriveMotor(true);
    EXPECT_TRUE(angle.inverted);
    EXPECT_TRUE(drive.inverted);

    module->setInvertAngleMotor(false);
    EXPECT_FALSE(angle.inverted);
}

TEST_F(CalibrationTest, NearPositionLimit)
{
    auto module = makeModule();
    EXPECT_FALSE(module->isNearPositionLimit());

    moveWheelTo(*module, 15001 * 360_deg);
    EXPECT_TRUE(module->isNearPositionLimit());

    moveWheelTo(*module, -15001 * 360_deg);
    EXPECT_TRUE(module->isNearPositionLimit());
}

/******************************************************************/
/*                      Configuration errors                      */
/******************************************************************/

TEST_F(CalibrationTest, ZeroSteeringRatioIsConfigurationError)
{
    drivetrain.steering_gear_ratio = 0.0;

    EXPECT_THROW(makeModule(), ConfigurationError);
    EXPECT_TRUE(log.empty());
}

TEST_F(CalibrationTest, NegativeDriveRatioIsConfigurationError)
{
    drivetrain.drive_gear_ratio = -8.0;

    EXPECT_THROW(makeModule(), ConfigurationError);
}

TEST_F(CalibrationTest, NonFiniteWheelIsConfigurationError)
{
    drivetrain.wheel_diameter = units::meter_t{std::nan("")};

    EXPECT_THROW(makeModule(), ConfigurationError);
}

TEST_F(CalibrationTest, BadOffsetIsConfigurationError)
{
    config.magnet_offset = 200_deg;

    EXPECT_THROW(makeModule(), ConfigurationError);
    EXPECT_EQ(sensor.offset_writes, 0);
}

TEST_F(CalibrationTest, RejectedMotorConfigIsConfigurationError)
{
    drive.configure_status = HardwareStatus::kNotConnected;

    EXPECT_THROW(makeModule(), ConfigurationError);
    EXPECT_EQ(angle.set_position_calls, 0);
}
