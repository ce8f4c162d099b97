#include "hardware/CANCoderAngleSensor.hpp"
#include "hardware/PhoenixStatus.hpp"
#include "AngleMath.hpp"
#include "SwerveErrors.hpp"

#include <fmt/format.h>

/******************************************************************/
/*                        Private Constants                        */
/******************************************************************/

constexpr int CONFIG_TIMEOUT_MS = 50;

/******************************************************************/
/*                   Public Function Definitions                  */
/******************************************************************/

swerve::CANCoderAngleSensor::CANCoderAngleSensor(int cancoder_adr)
    : cancoder{cancoder_adr}
{
    auto const status = fromErrorCode(cancoder.ConfigAbsoluteSensorRange(AbsoluteSensorRange::Signed_PlusMinus180, CONFIG_TIMEOUT_MS));
    if (!isOk(status))
        throw ConfigurationError{fmt::format("CANCoder {}: setting +/-180 range failed ({})", cancoder_adr, toString(status))};
}

std::optional<units::degree_t> swerve::CANCoderAngleSensor::getAbsolutePosition()
{
    double const position = cancoder.GetAbsolutePosition();

    if (cancoder.GetLastError() != ctre::phoenix::ErrorCode::OK)
        return std::nullopt;

    // signed range reports +180 inclusive
    return AngleMath::wrap180(units::degree_t{position});
}

std::optional<units::degree_t> swerve::CANCoderAngleSensor::getMagnetOffset()
{
    CANCoderConfiguration config;

    if (cancoder.GetAllConfigs(config, CONFIG_TIMEOUT_MS) != ctre::phoenix::ErrorCode::OK)
        return std::nullopt;

    return units::degree_t{config.magnetOffsetDegrees};
}

swerve::HardwareStatus swerve::CANCoderAngleSensor::setMagnetOffset(units::degree_t offset, units::millisecond_t timeout)
{
    CANCoderConfiguration config;

    int const timeout_ms = static_cast<int>(timeout.value());

    auto const read = fromErrorCode(cancoder.GetAllConfigs(config, timeout_ms));
    if (!isOk(read))
        return read;

    config.magnetOffsetDegrees = offset.value();
    config.absoluteSensorRange = AbsoluteSensorRange::Signed_PlusMinus180;

    return fromErrorCode(cancoder.ConfigAllSettings(config, timeout_ms));
}
