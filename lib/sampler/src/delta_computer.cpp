#include "delta_computer.h"

#include <lib/util/src/errors.h>

#include <fmt/format.h>

#include <cmath>

namespace procrate
{

namespace
{

int64_t required_counter(const Counters& counters, size_t i)
{
    const auto& value = counters[i];
    if (!value.has_value())
    {
        throw MissingField(kCounterNames[i]);
    }
    if (*value < 0)
    {
        throw InvalidValue(kCounterNames[i]);
    }
    return *value;
}

std::optional<int64_t> optional_io(const IoCounters& io, size_t i)
{
    const auto& value = io[i];
    if (value.has_value() && *value < 0)
    {
        throw InvalidValue(kIoCounterNames[i]);
    }
    return value;
}

void require_finite(double value, const char* name)
{
    if (!std::isfinite(value))
    {
        throw InvalidValue(name);
    }
}

double interval_rate(int64_t raw, double elapsed_seconds)
{
    if (raw > 0 && elapsed_seconds > 0)
    {
        return round_rate(static_cast<double>(raw) / elapsed_seconds);
    }
    return round_rate(static_cast<double>(raw));
}

double lifetime_rate(int64_t value, double age_seconds)
{
    if (age_seconds > 0)
    {
        return round_rate(static_cast<double>(value) / age_seconds);
    }
    return round_rate(static_cast<double>(value));
}

int64_t checked_delta(int64_t before, int64_t after, const char* name, pid_t pid)
{
    auto raw = after - before;
    if (raw < 0)
    {
        throw IntegrityError(fmt::format("counter '{}' of pid {} decreased from {} to {}", name, pid, before, after));
    }
    return raw;
}

void diff_same_process(const RawProcessRecord& baseline, const RawProcessRecord& current, double elapsed_seconds,
                       DeltaRecord* result)
{
    auto pid = result->identity.pid;
    for (size_t i = 0; i < kNumCounters; ++i)
    {
        auto before = required_counter(baseline.counters, i);
        auto after = required_counter(current.counters, i);
        result->rates[i] = interval_rate(checked_delta(before, after, kCounterNames[i], pid), elapsed_seconds);
    }

    for (size_t i = 0; i < kNumIoCounters; ++i)
    {
        auto before = optional_io(baseline.io, i);
        auto after = optional_io(current.io, i);
        if (!before || !after)
        {
            result->io_rates[i] = 0.0;
            continue;
        }
        result->io_rates[i] = interval_rate(checked_delta(*before, *after, kIoCounterNames[i], pid), elapsed_seconds);
    }
}

void average_since_start(const RawProcessRecord& current, double current_uptime, DeltaRecord* result)
{
    auto age = current_uptime - static_cast<double>(current.start_time) / ProcRecordConstants::ClockTicksPerSecond;
    for (size_t i = 0; i < kNumCounters; ++i)
    {
        result->rates[i] = lifetime_rate(required_counter(current.counters, i), age);
    }

    for (size_t i = 0; i < kNumIoCounters; ++i)
    {
        result->io_rates[i] = lifetime_rate(optional_io(current.io, i).value_or(0), age);
    }
}

}  // namespace

double round_rate(double value) noexcept { return std::round(value * 100.0) / 100.0; }

DeltaRecord compute_delta(const ProcessIdentity& identity, const RawProcessRecord* baseline,
                          const RawProcessRecord& current, double elapsed_seconds, double current_uptime)
{
    require_finite(elapsed_seconds, "time");
    require_finite(current_uptime, "uptime");

    DeltaRecord result;
    result.identity = identity;

    if (baseline != nullptr && baseline->start_time == current.start_time)
    {
        diff_same_process(*baseline, current, elapsed_seconds, &result);
    }
    else
    {
        average_since_start(current, current_uptime, &result);
    }

    result.ttime = round_rate(result.rate(Counter::UTime) + result.rate(Counter::STime));
    if (current.details)
    {
        result.details = *current.details;
    }
    return result;
}

}  // namespace procrate
