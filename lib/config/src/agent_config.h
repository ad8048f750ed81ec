#pragma once

#include <lib/sampler/src/sampler_config.h>

#include <rapidjson/document.h>

#include <optional>

namespace procrate
{

struct AgentConfigConstants
{
    static constexpr auto DefaultPath{"/etc/default/procrate-agent.json"};
    static constexpr auto DefaultIntervalSeconds{5};
};

struct AgentConfig
{
    SamplerConfig sampler;
    int interval_seconds{AgentConfigConstants::DefaultIntervalSeconds};

    // A missing file gives the defaults. A file that cannot be read or parsed, or
    // has the wrong shape, is logged and gives nullopt.
    static auto FromConfigFile(const char* file) -> std::optional<AgentConfig>;
    static auto FromJson(const rapidjson::Document& doc) -> std::optional<AgentConfig>;
};

}  // namespace procrate
