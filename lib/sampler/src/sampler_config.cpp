#include "sampler_config.h"

#include <lib/util/src/errors.h>
#include <lib/util/src/util.h>

#include <absl/strings/numbers.h>
#include <fmt/format.h>

namespace procrate
{

std::vector<pid_t> parse_pid_list(const std::vector<std::string>& pids)
{
    std::vector<pid_t> result;
    result.reserve(pids.size());
    for (const auto& pid_str : pids)
    {
        pid_t pid;
        if (!all_digits(pid_str.c_str()) || !absl::SimpleAtoi(pid_str, &pid))
        {
            throw ConfigurationError(fmt::format("PID '{}' is not a number", pid_str));
        }
        result.push_back(pid);
    }
    return result;
}

void validate_config(const SamplerConfig& config)
{
    const auto& files = config.files;
    const std::pair<const char*, const std::string*> names[] = {
        {"path", &files.path},       {"uptime", &files.uptime}, {"stat", &files.stat},
        {"statm", &files.statm},     {"status", &files.status}, {"cmdline", &files.cmdline},
        {"wchan", &files.wchan},     {"fd", &files.fd},         {"io", &files.io},
    };
    for (const auto& [key, value] : names)
    {
        if (value->empty())
        {
            throw ConfigurationError(fmt::format("file setting '{}' must not be empty", key));
        }
    }

    if (config.pids)
    {
        parse_pid_list(*config.pids);
    }
}

}  // namespace procrate
