#pragma once

#include <units/angle.h>
#include <units/length.h>
#include <units/velocity.h>

#include <string_view>

namespace swerve
{
    // Everything a module measured in one period, plus what it was last told
    struct ModuleSnapshot
    {
        units::degree_t internal_angle{0}; // unbounded, servoed
        units::degree_t external_angle{0}; // absolute sensor, [-180, 180)
        units::meters_per_second_t velocity{0};
        units::meter_t distance{0};
        units::degree_t target_angle{0};
        units::meters_per_second_t target_velocity{0};
    };

    /**
     * Receives one snapshot per module per period. Implementations must
     * not block and must not throw; a failed publish is dropped.
     *
     * attach() runs once per prefix, outside the control loop, and is
     * where an implementation allocates whatever publish() needs.
     */
    class ModuleTelemetry
    {
    public:
        virtual ~ModuleTelemetry() = default;

        virtual void attach(std::string_view) {}

        virtual void publish(std::string_view prefix, ModuleSnapshot const &snapshot) noexcept = 0;
    };
} // namespace swerve
