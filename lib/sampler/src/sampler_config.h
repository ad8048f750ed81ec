#pragma once

#include <lib/procfs/src/procfs_reader.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace procrate
{

struct SamplerConfig
{
    ProcFiles files;
    // When set, only these pids are sampled and /proc is never enumerated
    std::optional<std::vector<std::string>> pids;
    // 0 reports memory in pages, see UnitConverter
    uint64_t pages_to_bytes{0};
};

// Throws ConfigurationError for an empty path or file name, or a pid that is not
// a plain decimal number.
void validate_config(const SamplerConfig& config);

// Validates and converts a pid list. Throws ConfigurationError.
std::vector<pid_t> parse_pid_list(const std::vector<std::string>& pids);

}  // namespace procrate
