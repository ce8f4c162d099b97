#include "hardware/HardwareStatus.hpp"

std::string_view swerve::toString(HardwareStatus status)
{
    switch (status)
    {
    case HardwareStatus::kOk:
        return "ok";
    case HardwareStatus::kTimeout:
        return "timeout";
    case HardwareStatus::kNotConnected:
        return "not connected";
    case HardwareStatus::kInvalidParameter:
        return "invalid parameter";
    case HardwareStatus::kDeviceError:
        return "device error";
    }
    return "unknown";
}
