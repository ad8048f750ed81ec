#include "process_metrics.h"

#include <lib/logger/src/logger.h>

namespace procrate
{

void ProcessMetrics::update(const DeltaMap& deltas) noexcept
try
{
    for (const auto& entry : deltas)
    {
        update_process(entry.second);
    }
    Logger()->debug("Published metrics for {} processes", deltas.size());
}
catch (const std::exception& e)
{
    Logger()->error("Exception: {} in ProcessMetrics::update", e.what());
}

void ProcessMetrics::update_process(const DeltaRecord& d)
{
    using C = ProcessMetricsConstants;

    detail::gauge(registry_, C::CpuName, d, "user").Set(d.rate(Counter::UTime));
    detail::gauge(registry_, C::CpuName, d, "system").Set(d.rate(Counter::STime));
    detail::gauge(registry_, C::CpuName, d, "childUser").Set(d.rate(Counter::CUTime));
    detail::gauge(registry_, C::CpuName, d, "childSystem").Set(d.rate(Counter::CSTime));
    detail::gauge(registry_, C::CpuName, d, "total").Set(d.ttime);

    detail::gauge(registry_, C::FaultsName, d, "minor").Set(d.rate(Counter::MinFlt));
    detail::gauge(registry_, C::FaultsName, d, "major").Set(d.rate(Counter::MajFlt));
    detail::gauge(registry_, C::FaultsName, d, "childMinor").Set(d.rate(Counter::CMinFlt));
    detail::gauge(registry_, C::FaultsName, d, "childMajor").Set(d.rate(Counter::CMajFlt));

    detail::gauge(registry_, C::IoBytesName, d, "read").Set(d.rate(IoCounter::RChar));
    detail::gauge(registry_, C::IoBytesName, d, "write").Set(d.rate(IoCounter::WChar));
    detail::gauge(registry_, C::IoBytesName, d, "readStorage").Set(d.rate(IoCounter::ReadBytes));
    detail::gauge(registry_, C::IoBytesName, d, "writeStorage").Set(d.rate(IoCounter::WriteBytes));
    detail::gauge(registry_, C::IoBytesName, d, "cancelledWrite").Set(d.rate(IoCounter::CancelledWriteBytes));

    detail::gauge(registry_, C::IoSyscallsName, d, "read").Set(d.rate(IoCounter::SyscR));
    detail::gauge(registry_, C::IoSyscallsName, d, "write").Set(d.rate(IoCounter::SyscW));

    detail::gauge(registry_, C::ResidentName, d).Set(static_cast<double>(d.details.memory.resident));
    detail::gauge(registry_, C::VirtualName, d).Set(static_cast<double>(d.details.memory.size));
}

}  // namespace procrate
