#pragma once

#include "hardware/AbsoluteAngleSensor.hpp"

#include <ctre/Phoenix.h>

namespace swerve
{
    /**
     * CTRE CANCoder in absolute mode, +/-180, CCW positive.
     *
     * Not to be confused with the motor's CANEncoder, which is relative
     * only and continuous.
     */
    class CANCoderAngleSensor : public AbsoluteAngleSensor
    {
    public:
        // Throws ConfigurationError if the range can't be set
        explicit CANCoderAngleSensor(int cancoder_adr);

        std::optional<units::degree_t> getAbsolutePosition() override;

        std::optional<units::degree_t> getMagnetOffset() override;

        HardwareStatus setMagnetOffset(units::degree_t offset, units::millisecond_t timeout) override;

    private:
        CANCoder cancoder;
    };
} // namespace swerve
