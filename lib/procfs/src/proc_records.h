#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <sys/types.h>

namespace procrate
{

struct ProcRecordConstants
{
    // USER_HZ as exposed by /proc/<pid>/stat on every mainstream kernel config
    static constexpr double ClockTicksPerSecond{100.0};
    static constexpr auto NotAvailable{"N/a"};
};

// Cumulative scheduling counters from /proc/<pid>/stat. These are mandatory for
// delta computation.
enum class Counter : size_t
{
    MinFlt,
    CMinFlt,
    MajFlt,
    CMajFlt,
    UTime,
    STime,
    CUTime,
    CSTime,
};
constexpr size_t kNumCounters = 8;
constexpr std::array<const char*, kNumCounters> kCounterNames{"minflt", "cminflt", "mayflt", "cmayflt",
                                                               "utime",  "stime",   "cutime", "cstime"};

// Cumulative I/O accounting from /proc/<pid>/io. Best effort: any of these can be
// missing (kernel without task io accounting, or a file we may not read).
enum class IoCounter : size_t
{
    RChar,
    WChar,
    SyscR,
    SyscW,
    ReadBytes,
    WriteBytes,
    CancelledWriteBytes,
};
constexpr size_t kNumIoCounters = 7;
constexpr std::array<const char*, kNumIoCounters> kIoCounterNames{
    "rchar", "wchar", "syscr", "syscw", "read_bytes", "write_bytes", "cancelled_write_bytes"};

using Counters = std::array<std::optional<int64_t>, kNumCounters>;
using IoCounters = std::array<std::optional<int64_t>, kNumIoCounters>;

constexpr size_t index_of(Counter c) { return static_cast<size_t>(c); }
constexpr size_t index_of(IoCounter c) { return static_cast<size_t>(c); }

// Fields of /proc/<pid>/stat
struct StatFields
{
    std::string comm;
    char state{'?'};
    int64_t ppid{};
    int64_t pgrp{};
    int64_t session{};
    int64_t tty_nr{};
    Counters counters{};
    int64_t priority{};
    int64_t nice{};
    int64_t num_threads{};
    uint64_t start_time{};  // clock ticks since boot
    uint64_t vsize{};
    int64_t nswap{};
    int64_t cnswap{};
    int64_t processor{};
};

// Fields of /proc/<pid>/statm, in pages unless converted
struct MemoryPages
{
    uint64_t size{};
    uint64_t resident{};
    uint64_t share{};
    uint64_t trs{};
    uint64_t lrs{};
    uint64_t drs{};
    uint64_t dtp{};
};

// Descriptive, non-cumulative state of a process. Never part of delta arithmetic.
struct ProcessDetails
{
    std::string comm;
    char state{'?'};
    int64_t ppid{};
    int64_t pgrp{};
    int64_t session{};
    int64_t tty_nr{};
    int64_t priority{};
    int64_t nice{};
    int64_t num_threads{};
    uint64_t vsize{};
    int64_t nswap{};
    int64_t cnswap{};
    int64_t processor{};
    std::string actime;  // D:HH:MM:SS since the process started
    MemoryPages memory;
    std::string owner;
    std::string cmdline;
    std::string wchan;
    std::map<std::string, std::string> fds;  // fd number -> link target
};

// One observation of one process
struct RawProcessRecord
{
    uint64_t start_time{};
    Counters counters{};
    IoCounters io{};
    std::optional<ProcessDetails> details;  // only present in full reads
};

}  // namespace procrate
