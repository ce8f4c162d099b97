#pragma once

#include <string_view>

namespace swerve
{
    // Result of a write across the actuator/sensor boundary. Vendor
    // error codes are folded into these by the adapters.
    enum class HardwareStatus
    {
        kOk,
        kTimeout,
        kNotConnected,
        kInvalidParameter,
        kDeviceError
    };

    std::string_view toString(HardwareStatus status);

    inline bool isOk(HardwareStatus status) { return status == HardwareStatus::kOk; }
} // namespace swerve
