#include "Constants.hpp"
#include "SwerveErrors.hpp"

#include <gtest/gtest.h>

#include <wpi/numbers>

#include <set>
#include <string>

using namespace swerve;

TEST(ConstantsTest, DrivetrainConfigIsValid)
{
    auto const config = DriveTrain::drivetrainConfig();

    EXPECT_NO_THROW(config.validate());
    EXPECT_NEAR(config.degreesPerMotorRotation(), 360.0 / DriveTrain::STEERING_GEAR_RATIO, 1e-12);
    EXPECT_NEAR(config.metersPerMotorRotation(),
                wpi::numbers::pi * DriveTrain::WHEEL_DIAMETER.value() / DriveTrain::DRIVE_GEAR_RATIO,
                1e-12);
    EXPECT_FALSE(config.optimize_reversal);
}

TEST(ConstantsTest, EveryCornerIsValidAndDistinct)
{
    std::set<std::string> names;
    std::set<int> ids;

    for (auto const &corner : DriveTrain::CORNERS)
    {
        auto const config = DriveTrain::moduleConfig(corner);
        EXPECT_NO_THROW(config.validate());
        names.insert(config.name);

        auto const can = DriveTrain::canIds(corner);
        ids.insert(can.driver_adr);
        ids.insert(can.turner_adr);
        ids.insert(can.cancoder_adr);
    }

    EXPECT_EQ(names.size(), 4u);
    EXPECT_EQ(ids.size(), 12u);
}

TEST(ConstantsTest, CornersAreLaidOutAroundCentre)
{
    auto const fl = DriveTrain::moduleConfig(DriveTrain::Corner::FRONT_LEFT);
    auto const br = DriveTrain::moduleConfig(DriveTrain::Corner::BACK_RIGHT);

    EXPECT_GT(fl.pos_x.value(), 0.0);
    EXPECT_GT(fl.pos_y.value(), 0.0);
    EXPECT_DOUBLE_EQ(br.pos_x.value(), -fl.pos_x.value());
    EXPECT_DOUBLE_EQ(br.pos_y.value(), -fl.pos_y.value());
}

TEST(ModuleConfigTest, RejectsEmptyName)
{
    ModuleConfig config;

    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST(ModuleConfigTest, OffsetBounds)
{
    ModuleConfig config;
    config.name = "FL";

    config.magnet_offset = 180_deg;
    EXPECT_NO_THROW(config.validate());

    config.magnet_offset = -180.5_deg;
    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST(DrivetrainConfigTest, RejectsNonPositiveCurrentLimit)
{
    DrivetrainConfig config;
    config.drive_current_limit = units::ampere_t{0};

    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST(HardwareStatusTest, Names)
{
    EXPECT_EQ(toString(HardwareStatus::kOk), "ok");
    EXPECT_EQ(toString(HardwareStatus::kTimeout), "timeout");
    EXPECT_TRUE(isOk(HardwareStatus::kOk));
    EXPECT_FALSE(isOk(HardwareStatus::kNotConnected));
}
