#include "procfs_reader.h"

#include <lib/util/src/errors.h>
#include <lib/util/src/util.h>

#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <absl/strings/ascii.h>
#include <absl/time/clock.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <pwd.h>
#include <unistd.h>

namespace procrate
{

struct StatLayout
{
    // offsets into the fields that follow the "(comm)" part of the stat line
    static constexpr size_t State{0};
    static constexpr size_t Ppid{1};
    static constexpr size_t Pgrp{2};
    static constexpr size_t Session{3};
    static constexpr size_t TtyNr{4};
    static constexpr size_t MinFlt{7};
    static constexpr size_t Priority{15};
    static constexpr size_t Nice{16};
    static constexpr size_t NumThreads{17};
    static constexpr size_t StartTime{19};
    static constexpr size_t VSize{20};
    static constexpr size_t NSwap{33};
    static constexpr size_t CNSwap{34};
    static constexpr size_t Processor{36};
    static constexpr size_t MinFields{37};
};

static constexpr size_t kStatmFields = 7;

template <typename T>
static bool parse_field(const std::vector<absl::string_view>& fields, size_t idx, T* out)
{
    return absl::SimpleAtoi(fields[idx], out);
}

std::optional<StatFields> parse_stat_line(const std::string& line)
{
    auto open = line.find('(');
    auto close = line.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open)
    {
        return std::nullopt;
    }

    std::vector<absl::string_view> fields =
        absl::StrSplit(absl::string_view(line).substr(close + 1), absl::ByAnyChar(" \t\n"), absl::SkipEmpty());
    if (fields.size() < StatLayout::MinFields || fields[StatLayout::State].empty())
    {
        return std::nullopt;
    }

    StatFields stat;
    stat.comm = line.substr(open + 1, close - open - 1);
    stat.state = fields[StatLayout::State][0];

    bool ok = parse_field(fields, StatLayout::Ppid, &stat.ppid);
    ok &= parse_field(fields, StatLayout::Pgrp, &stat.pgrp);
    ok &= parse_field(fields, StatLayout::Session, &stat.session);
    ok &= parse_field(fields, StatLayout::TtyNr, &stat.tty_nr);
    for (size_t i = 0; i < kNumCounters; ++i)
    {
        int64_t value;
        if (!parse_field(fields, StatLayout::MinFlt + i, &value))
        {
            return std::nullopt;
        }
        stat.counters[i] = value;
    }
    ok &= parse_field(fields, StatLayout::Priority, &stat.priority);
    ok &= parse_field(fields, StatLayout::Nice, &stat.nice);
    ok &= parse_field(fields, StatLayout::NumThreads, &stat.num_threads);
    ok &= parse_field(fields, StatLayout::StartTime, &stat.start_time);
    ok &= parse_field(fields, StatLayout::VSize, &stat.vsize);
    ok &= parse_field(fields, StatLayout::NSwap, &stat.nswap);
    ok &= parse_field(fields, StatLayout::CNSwap, &stat.cnswap);
    ok &= parse_field(fields, StatLayout::Processor, &stat.processor);
    if (!ok)
    {
        return std::nullopt;
    }
    return stat;
}

std::string format_active_time(int64_t seconds)
{
    if (seconds < 0)
    {
        seconds = 0;
    }
    auto days = seconds / 86400;
    seconds %= 86400;
    auto hours = seconds / 3600;
    seconds %= 3600;
    auto minutes = seconds / 60;
    seconds %= 60;
    return fmt::format("{}:{:02d}:{:02d}:{:02d}", days, hours, minutes, seconds);
}

ProcfsReader::ProcfsReader(ProcFiles files) noexcept : files_(std::move(files)) {}

std::string ProcfsReader::pid_dir(pid_t pid) const { return fmt::format("{}/{}", files_.path, pid); }

double ProcfsReader::read_uptime() const
{
    auto lines = read_lines_fields(files_.path, files_.uptime.c_str());
    double uptime;
    if (lines.empty() || lines[0].empty() || !absl::SimpleAtod(lines[0][0], &uptime) ||
        !std::isfinite(uptime))
    {
        throw EnumerationFailure(fmt::format("unable to read uptime from {}/{}", files_.path, files_.uptime));
    }
    return uptime;
}

std::vector<pid_t> ProcfsReader::list_processes() const
{
    DirHandle dir_handle{files_.path.c_str()};
    if (!dir_handle)
    {
        throw EnumerationFailure(fmt::format("unable to open directory {}: {}", files_.path, strerror(errno)));
    }

    std::vector<pid_t> pids;
    for (;;)
    {
        auto entry = readdir(dir_handle);
        if (entry == nullptr) break;

        pid_t pid;
        if (all_digits(entry->d_name) && absl::SimpleAtoi(entry->d_name, &pid))
        {
            pids.push_back(pid);
        }
    }
    std::sort(pids.begin(), pids.end());
    return pids;
}

double ProcfsReader::capture_time() const { return absl::ToDoubleSeconds(absl::Now() - absl::UnixEpoch()); }

std::optional<StatFields> ProcfsReader::read_stat(pid_t pid) const
{
    auto fp = open_file(pid_dir(pid), files_.stat.c_str());
    if (fp == nullptr)
    {
        return std::nullopt;
    }

    char line[4096];
    if (std::fgets(line, sizeof line, fp) == nullptr)
    {
        return std::nullopt;
    }

    auto stat = parse_stat_line(line);
    if (!stat)
    {
        Logger()->warn("Unable to parse {}/{}", pid_dir(pid), files_.stat);
    }
    return stat;
}

IoCounters ProcfsReader::read_io(pid_t pid) const
{
    std::unordered_map<std::string, int64_t> stats;
    parse_kv_from_file(pid_dir(pid), files_.io.c_str(), &stats);

    IoCounters io{};
    for (size_t i = 0; i < kNumIoCounters; ++i)
    {
        auto it = stats.find(kIoCounterNames[i]);
        if (it != stats.end())
        {
            io[i] = it->second;
        }
    }
    return io;
}

std::optional<MemoryPages> ProcfsReader::read_memory(pid_t pid) const
{
    auto lines = read_lines_fields(pid_dir(pid), files_.statm.c_str());
    if (lines.empty() || lines[0].size() < kStatmFields)
    {
        return std::nullopt;
    }

    const auto& f = lines[0];
    MemoryPages mem;
    uint64_t* values[] = {&mem.size, &mem.resident, &mem.share, &mem.trs, &mem.lrs, &mem.drs, &mem.dtp};
    for (size_t i = 0; i < kStatmFields; ++i)
    {
        if (!absl::SimpleAtoi(f[i], values[i]))
        {
            Logger()->warn("Invalid field {} in {}/{}", f[i], pid_dir(pid), files_.statm);
            return std::nullopt;
        }
    }
    return mem;
}

std::optional<std::string> ProcfsReader::read_owner(pid_t pid) const
{
    auto fp = open_file(pid_dir(pid), files_.status.c_str());
    if (fp == nullptr)
    {
        return std::nullopt;
    }

    char line[1024];
    while (std::fgets(line, sizeof line, fp) != nullptr)
    {
        if (!starts_with(line, "Uid:"))
        {
            continue;
        }

        uid_t uid;
        if (sscanf(line, "Uid: %u", &uid) != 1)
        {
            break;
        }

        struct passwd pwd;
        struct passwd* result = nullptr;
        char buf[4096];
        if (getpwuid_r(uid, &pwd, buf, sizeof buf, &result) == 0 && result != nullptr)
        {
            return std::string{result->pw_name};
        }
        break;
    }
    return std::string{ProcRecordConstants::NotAvailable};
}

std::optional<std::string> ProcfsReader::read_cmdline(pid_t pid) const
{
    std::ifstream in(fmt::format("{}/{}", pid_dir(pid), files_.cmdline), std::ios::binary);
    if (!in)
    {
        return std::nullopt;
    }

    std::string contents{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    std::replace(contents.begin(), contents.end(), '\0', ' ');
    auto stripped = absl::StripAsciiWhitespace(contents);
    if (stripped.empty())
    {
        return std::string{ProcRecordConstants::NotAvailable};
    }
    return std::string{stripped};
}

std::optional<std::string> ProcfsReader::read_wchan(pid_t pid) const
{
    std::ifstream in(fmt::format("{}/{}", pid_dir(pid), files_.wchan));
    if (!in)
    {
        return std::nullopt;
    }

    std::string wchan;
    std::getline(in, wchan);
    return wchan;
}

std::map<std::string, std::string> ProcfsReader::read_fds(pid_t pid) const
{
    std::map<std::string, std::string> fds;
    auto fd_dir = fmt::format("{}/{}", pid_dir(pid), files_.fd);
    DirHandle dh{fd_dir.c_str()};
    if (!dh)
    {
        return fds;
    }

    for (;;)
    {
        auto entry = readdir(dh);
        if (entry == nullptr) break;
        if (entry->d_name[0] == '.') continue;

        char target[4096];
        auto link = fmt::format("{}/{}", fd_dir, entry->d_name);
        auto len = readlink(link.c_str(), target, sizeof target - 1);
        if (len > 0)
        {
            fds.emplace(entry->d_name, std::string(target, static_cast<size_t>(len)));
        }
    }
    return fds;
}

namespace
{

struct ReadContext
{
    const ProcfsReader& reader;
    pid_t pid;
    double uptime;
    RawProcessRecord* record;
};

// Each parser fills its part of the record and returns false if the process
// must be dropped from this cycle.
using DetailParser = bool (*)(const ReadContext& ctx);

bool parse_statm(const ReadContext& ctx)
{
    auto mem = ctx.reader.read_memory(ctx.pid);
    if (!mem) return false;
    ctx.record->details->memory = *mem;
    return true;
}

bool parse_stat(const ReadContext& ctx)
{
    auto stat = ctx.reader.read_stat(ctx.pid);
    if (!stat) return false;

    auto* record = ctx.record;
    record->start_time = stat->start_time;
    record->counters = stat->counters;
    if (record->details)
    {
        auto& d = *record->details;
        d.comm = std::move(stat->comm);
        d.state = stat->state;
        d.ppid = stat->ppid;
        d.pgrp = stat->pgrp;
        d.session = stat->session;
        d.tty_nr = stat->tty_nr;
        d.priority = stat->priority;
        d.nice = stat->nice;
        d.num_threads = stat->num_threads;
        d.vsize = stat->vsize;
        d.nswap = stat->nswap;
        d.cnswap = stat->cnswap;
        d.processor = stat->processor;
        auto active = ctx.uptime - static_cast<double>(stat->start_time) / ProcRecordConstants::ClockTicksPerSecond;
        d.actime = format_active_time(static_cast<int64_t>(active));
    }
    return true;
}

bool parse_io(const ReadContext& ctx)
{
    ctx.record->io = ctx.reader.read_io(ctx.pid);
    return true;
}

bool parse_owner(const ReadContext& ctx)
{
    auto owner = ctx.reader.read_owner(ctx.pid);
    if (!owner) return false;
    ctx.record->details->owner = std::move(*owner);
    return true;
}

bool parse_cmdline(const ReadContext& ctx)
{
    auto cmdline = ctx.reader.read_cmdline(ctx.pid);
    if (!cmdline) return false;
    ctx.record->details->cmdline = std::move(*cmdline);
    return true;
}

bool parse_wchan(const ReadContext& ctx)
{
    auto wchan = ctx.reader.read_wchan(ctx.pid);
    if (!wchan) return false;
    ctx.record->details->wchan = std::move(*wchan);
    return true;
}

bool parse_fd(const ReadContext& ctx)
{
    ctx.record->details->fds = ctx.reader.read_fds(ctx.pid);
    return true;
}

struct DetailEntry
{
    DetailKind kind;
    DetailParser parse;
};

constexpr DetailEntry kFullRead[] = {
    {DetailKind::Statm, parse_statm},     {DetailKind::Stat, parse_stat},   {DetailKind::Io, parse_io},
    {DetailKind::Owner, parse_owner},     {DetailKind::Cmdline, parse_cmdline},
    {DetailKind::Wchan, parse_wchan},     {DetailKind::Fd, parse_fd},
};

constexpr DetailEntry kBaselineRead[] = {
    {DetailKind::Stat, parse_stat},
    {DetailKind::Io, parse_io},
};

template <size_t N>
bool run_parsers(const DetailEntry (&parsers)[N], const ReadContext& ctx)
{
    for (const auto& entry : parsers)
    {
        if (!entry.parse(ctx))
        {
            Logger()->debug("pid {} vanished while reading kind {}", ctx.pid, static_cast<int>(entry.kind));
            return false;
        }
    }
    return true;
}

}  // namespace

std::optional<RawProcessRecord> ProcfsReader::read_process(pid_t pid, ReadScope scope, double uptime) const
{
    RawProcessRecord record;
    ReadContext ctx{*this, pid, uptime, &record};
    bool complete;
    if (scope == ReadScope::Full)
    {
        record.details.emplace();
        complete = run_parsers(kFullRead, ctx);
    }
    else
    {
        complete = run_parsers(kBaselineRead, ctx);
    }

    if (!complete)
    {
        return std::nullopt;
    }
    return record;
}

}  // namespace procrate
