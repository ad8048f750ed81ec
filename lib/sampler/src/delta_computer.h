#pragma once

#include "snapshot.h"

namespace procrate
{

// Round to two decimals, the precision every rate is reported with.
double round_rate(double value) noexcept;

// Turn one process's counters into per-second rates.
//
// When baseline is non-null and has the same start time as current, each rate is
// (current - baseline) / elapsed_seconds; a counter that went backwards throws
// IntegrityError. Otherwise the process is treated as seen for the first time and
// each rate is value / (current_uptime - start time), its average since creation.
//
// A missing scheduling counter throws MissingField and a negative one throws
// InvalidValue. I/O counters are best effort: one missing on either side gives a
// rate of zero.
DeltaRecord compute_delta(const ProcessIdentity& identity, const RawProcessRecord* baseline,
                          const RawProcessRecord& current, double elapsed_seconds, double current_uptime);

}  // namespace procrate
