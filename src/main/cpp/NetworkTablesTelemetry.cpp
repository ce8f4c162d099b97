#include "NetworkTablesTelemetry.hpp"

#include <fmt/format.h>

/******************************************************************/
/*                   Public Function Definitions                  */
/******************************************************************/

swerve::NetworkTablesTelemetry::NetworkTablesTelemetry(nt::NetworkTableInstance instance)
    : table{instance.GetTable(TABLE_NAME)}
{
}

void swerve::NetworkTablesTelemetry::attach(std::string_view prefix)
{
    if (entries.find(prefix) != entries.end())
        return;

    auto const key = [&prefix](std::string_view name)
    { return fmt::format("{}/{}", prefix, name); };

    Entries created{
        table->GetEntry(key("angle")),
        table->GetEntry(key("angle_ext")),
        table->GetEntry(key("velocity")),
        table->GetEntry(key("distance")),
        table->GetEntry(key("angle_target")),
        table->GetEntry(key("velocity_target")),
    };

    entries.emplace(std::string{prefix}, created);
}

void swerve::NetworkTablesTelemetry::publish(std::string_view prefix, ModuleSnapshot const &snapshot) noexcept
{
    auto const found = entries.find(prefix);
    if (found == entries.end())
        return;

    auto &e = found->second;

    e.angle.SetDouble(snapshot.internal_angle.value());
    e.angle_ext.SetDouble(snapshot.external_angle.value());
    e.velocity.SetDouble(snapshot.velocity.value());
    e.distance.SetDouble(snapshot.distance.value());
    e.angle_target.SetDouble(snapshot.target_angle.value());
    e.velocity_target.SetDouble(snapshot.target_velocity.value());
}
