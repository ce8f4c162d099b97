#pragma once

#include "hardware/HardwareStatus.hpp"

#include <ctre/phoenix/ErrorCode.h>

#include <initializer_list>

namespace swerve
{
    inline HardwareStatus fromErrorCode(ctre::phoenix::ErrorCode const &code)
    {
        using ctre::phoenix::ErrorCode;

        if (code == ErrorCode::OK)
            return HardwareStatus::kOk;
        if (code == ErrorCode::RxTimeout || code == ErrorCode::TxTimeout || code == ErrorCode::SigNotUpdated)
            return HardwareStatus::kTimeout;
        if (code == ErrorCode::SensorNotPresent)
            return HardwareStatus::kNotConnected;
        if (code == ErrorCode::InvalidParamValue)
            return HardwareStatus::kInvalidParameter;
        return HardwareStatus::kDeviceError;
    }

    // First failure of a batch of config calls, kOk if none failed
    inline HardwareStatus firstError(std::initializer_list<ctre::phoenix::ErrorCode> codes)
    {
        for (auto const &code : codes)
        {
            auto const status = fromErrorCode(code);
            if (!isOk(status))
                return status;
        }
        return HardwareStatus::kOk;
    }
} // namespace swerve
