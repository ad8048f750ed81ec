#pragma once

#include <lib/sampler/src/snapshot.h>

#include <spectator/registry.h>

#include <string>
#include <string_view>
#include <unordered_map>

struct ProcessMetricsConstants
{
    // Gauges of processes that exited stop being reported after this long
    static constexpr auto GaugeTTLSeconds{60};
    static constexpr auto CpuName{"proc.cpu"};
    static constexpr auto FaultsName{"proc.faults"};
    static constexpr auto IoBytesName{"proc.io.bytes"};
    static constexpr auto IoSyscallsName{"proc.io.syscalls"};
    static constexpr auto ResidentName{"proc.mem.resident"};
    static constexpr auto VirtualName{"proc.mem.virtual"};
};

namespace procrate
{

namespace detail
{

inline auto process_tags(const DeltaRecord& delta)
{
    return std::unordered_map<std::string, std::string>{{"pid", std::to_string(delta.identity.pid)},
                                                        {"cmd", delta.details.comm}};
}

inline auto gauge(Registry* registry, std::string_view name, const DeltaRecord& delta, std::string_view id)
{
    auto tags = process_tags(delta);
    tags.emplace("id", std::string(id));
    return registry->CreateGauge(std::string(name), tags, ProcessMetricsConstants::GaugeTTLSeconds);
}

inline auto gauge(Registry* registry, std::string_view name, const DeltaRecord& delta)
{
    return registry->CreateGauge(std::string(name), process_tags(delta), ProcessMetricsConstants::GaugeTTLSeconds);
}

}  // namespace detail

// Publishes the rates of one sample as per-process gauges.
//
// CPU rates are in clock ticks per second, which at 100 ticks per second is the
// percentage of one core. Memory gauges carry whatever unit the engine converts
// statm values to.
class ProcessMetrics
{
   public:
    explicit ProcessMetrics(Registry* registry) noexcept : registry_{registry} {}

    void update(const DeltaMap& deltas) noexcept;

   private:
    void update_process(const DeltaRecord& delta);

    Registry* registry_;
};

}  // namespace procrate
