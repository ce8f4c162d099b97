#pragma once

#include "ModuleTelemetry.hpp"

#include <networktables/NetworkTable.h>
#include <networktables/NetworkTableEntry.h>
#include <networktables/NetworkTableInstance.h>

#include <map>
#include <memory>
#include <string>

namespace swerve
{
    /**
     * Publishes module snapshots under the drivetrain table:
     *   DT/<prefix>/angle, angle_ext, velocity, distance,
     *   angle_target, velocity_target
     *
     * One instance can serve all four modules. Entries are created by
     * attach(); a prefix that was never attached is not published.
     */
    class NetworkTablesTelemetry : public ModuleTelemetry
    {
    public:
        static constexpr char const *TABLE_NAME = "DT";

        explicit NetworkTablesTelemetry(nt::NetworkTableInstance instance = nt::NetworkTableInstance::GetDefault());

        void attach(std::string_view prefix) override;

        void publish(std::string_view prefix, ModuleSnapshot const &snapshot) noexcept override;

    private:
        struct Entries
        {
            nt::NetworkTableEntry angle;
            nt::NetworkTableEntry angle_ext;
            nt::NetworkTableEntry velocity;
            nt::NetworkTableEntry distance;
            nt::NetworkTableEntry angle_target;
            nt::NetworkTableEntry velocity_target;
        };

        std::shared_ptr<nt::NetworkTable> table;
        std::map<std::string, Entries, std::less<>> entries;
    };
} // namespace swerve
