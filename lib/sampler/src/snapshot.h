#pragma once

#include <lib/procfs/src/proc_records.h>

#include <map>

namespace procrate
{

// A pid alone is not enough to tell two observations apart: the kernel reuses
// pids, so the start time has to match as well.
struct ProcessIdentity
{
    pid_t pid{};
    uint64_t start_time{};  // clock ticks since boot

    bool operator==(const ProcessIdentity& other) const noexcept
    {
        return pid == other.pid && start_time == other.start_time;
    }
    bool operator!=(const ProcessIdentity& other) const noexcept { return !(*this == other); }
};

struct Snapshot
{
    double timestamp{};  // seconds since the epoch
    double uptime{};     // seconds since boot
    std::map<pid_t, RawProcessRecord> processes;
};

// Per-process rates for one interval. Each value is per second, rounded to two
// decimals.
//
// For a process seen in the previous sample the rates cover the interval
// between the two samples. For a process that is new (or whose pid was reused)
// they are averages since the process started. Both cases produce the same
// shape, so a consumer cannot tell which one a given record holds.
struct DeltaRecord
{
    ProcessIdentity identity;
    std::array<double, kNumCounters> rates{};
    double ttime{};  // utime + stime
    std::array<double, kNumIoCounters> io_rates{};
    ProcessDetails details;

    [[nodiscard]] double rate(Counter c) const noexcept { return rates[index_of(c)]; }
    [[nodiscard]] double rate(IoCounter c) const noexcept { return io_rates[index_of(c)]; }
};

using DeltaMap = std::map<pid_t, DeltaRecord>;

}  // namespace procrate
