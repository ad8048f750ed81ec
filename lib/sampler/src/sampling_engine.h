#pragma once

#include "delta_computer.h"
#include "sampler_config.h"
#include "snapshot.h"
#include "unit_converter.h"

#include <lib/logger/src/logger.h>
#include <lib/procfs/src/procfs_reader.h>
#include <lib/util/src/errors.h>

#include <cmath>
#include <optional>
#include <utility>
#include <vector>

namespace procrate
{

// Keeps the previous observation of every process and turns the next one into
// per-second rates.
//
// Provider supplies the raw observations. It needs read_uptime(),
// list_processes(), capture_time() and read_process(pid, scope, uptime) with the
// semantics of ProcfsReader; tests substitute a scripted one.
//
// Not thread safe: one engine belongs to one sampling loop.
template <typename Provider = ProcfsReader>
class SamplingEngine
{
   public:
    explicit SamplingEngine(SamplerConfig config = {})
        : SamplingEngine(config, Provider{config.files})
    {
    }

    SamplingEngine(const SamplerConfig& config, Provider provider)
        : provider_{std::move(provider)}, converter_{config.pages_to_bytes}
    {
        validate_config(config);
        if (config.pids)
        {
            fixed_pids_ = parse_pid_list(*config.pids);
        }
    }

    // Record the first baseline. Calling it again starts over from a fresh one.
    void initialize()
    {
        if (baseline_)
        {
            Logger()->warn("Engine already initialized, capturing a new baseline");
        }
        baseline_ = capture(ReadScope::Baseline);
        Logger()->debug("Baseline captured for {} processes", baseline_->processes.size());
    }

    // Rates for every process alive now, relative to the last call (or to
    // initialize()). The baseline is replaced only if every process could be
    // diffed, so a failed call leaves the engine as it was.
    DeltaMap sample()
    {
        if (!baseline_)
        {
            throw UninitializedUse("there are no initial statistics defined");
        }

        auto current = capture(ReadScope::Full);
        if (!std::isfinite(baseline_->timestamp) || !std::isfinite(current.timestamp))
        {
            throw InvalidValue("time");
        }
        auto elapsed = current.timestamp - baseline_->timestamp;

        DeltaMap deltas;
        for (const auto& [pid, record] : current.processes)
        {
            auto it = baseline_->processes.find(pid);
            const RawProcessRecord* previous = it == baseline_->processes.end() ? nullptr : &it->second;
            ProcessIdentity identity{pid, record.start_time};
            deltas.emplace(pid, compute_delta(identity, previous, record, elapsed, current.uptime));
        }

        baseline_ = strip_details(std::move(current));
        return deltas;
    }

    // A full observation, converted but not diffed. Leaves the baseline alone.
    Snapshot raw() const { return capture(ReadScope::Full); }

    [[nodiscard]] bool initialized() const noexcept { return baseline_.has_value(); }
    [[nodiscard]] const std::optional<Snapshot>& baseline() const noexcept { return baseline_; }

   private:
    std::vector<pid_t> discover() const
    {
        if (fixed_pids_)
        {
            return *fixed_pids_;
        }
        return provider_.list_processes();
    }

    Snapshot capture(ReadScope scope) const
    {
        Snapshot snapshot;
        snapshot.uptime = provider_.read_uptime();
        snapshot.timestamp = provider_.capture_time();

        for (auto pid : discover())
        {
            auto record = provider_.read_process(pid, scope, snapshot.uptime);
            if (!record)
            {
                Logger()->debug("Process {} vanished while reading it, skipping", pid);
                continue;
            }
            if (record->details)
            {
                record->details->memory = converter_.convert(record->details->memory);
            }
            snapshot.processes.emplace(pid, std::move(*record));
        }
        return snapshot;
    }

    // Only the counters are needed to diff against, and only for processes that
    // are still alive: exited pids drop out here.
    static Snapshot strip_details(Snapshot current)
    {
        for (auto& entry : current.processes)
        {
            entry.second.details.reset();
        }
        return current;
    }

    Provider provider_;
    UnitConverter converter_;
    std::optional<std::vector<pid_t>> fixed_pids_;
    std::optional<Snapshot> baseline_;
};

}  // namespace procrate
