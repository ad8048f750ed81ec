#include "agent_config.h"

#include <lib/files/src/files.h>
#include <lib/logger/src/logger.h>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>

#include <unistd.h>

namespace procrate
{

namespace
{

// Names under "files" and where they go
struct FileSetting
{
    const char* key;
    std::string ProcFiles::*member;
};

constexpr FileSetting kFileSettings[] = {
    {"uptime", &ProcFiles::uptime}, {"stat", &ProcFiles::stat},       {"statm", &ProcFiles::statm},
    {"status", &ProcFiles::status}, {"cmdline", &ProcFiles::cmdline}, {"wchan", &ProcFiles::wchan},
    {"fd", &ProcFiles::fd},         {"io", &ProcFiles::io},
};

bool parse_files(const rapidjson::Value& files, ProcFiles* result)
{
    auto logger = Logger();
    if (!files.IsObject())
    {
        logger->error("Invalid config file. 'files' should be a JSON object");
        return false;
    }
    for (const auto& setting : kFileSettings)
    {
        if (!files.HasMember(setting.key))
        {
            continue;
        }
        const auto& value = files[setting.key];
        if (!value.IsString())
        {
            logger->error("Invalid config file. 'files.{}' should be a string", setting.key);
            return false;
        }
        result->*setting.member = value.GetString();
    }
    return true;
}

bool parse_pids(const rapidjson::Value& pids, std::vector<std::string>* result)
{
    if (!pids.IsArray())
    {
        Logger()->error("Invalid config file. 'pids' should be an array");
        return false;
    }
    for (const auto& pid : pids.GetArray())
    {
        if (pid.IsString())
        {
            result->emplace_back(pid.GetString());
        }
        else if (pid.IsUint())
        {
            result->emplace_back(std::to_string(pid.GetUint()));
        }
        else
        {
            Logger()->error("Invalid config file. 'pids' entries should be numbers or strings");
            return false;
        }
    }
    return true;
}

}  // namespace

auto AgentConfig::FromJson(const rapidjson::Document& doc) -> std::optional<AgentConfig>
{
    auto logger = Logger();
    if (!doc.IsObject())
    {
        logger->error("Invalid config file. Should be a JSON object");
        return {};
    }

    AgentConfig config;
    if (doc.HasMember("proc_path"))
    {
        if (!doc["proc_path"].IsString())
        {
            logger->error("Invalid config file. 'proc_path' should be a string");
            return {};
        }
        config.sampler.files.path = doc["proc_path"].GetString();
    }

    if (doc.HasMember("files") && !parse_files(doc["files"], &config.sampler.files))
    {
        return {};
    }

    if (doc.HasMember("pids"))
    {
        std::vector<std::string> pids;
        if (!parse_pids(doc["pids"], &pids))
        {
            return {};
        }
        config.sampler.pids = std::move(pids);
    }

    if (doc.HasMember("pages_to_bytes"))
    {
        if (!doc["pages_to_bytes"].IsUint64())
        {
            logger->error("Invalid config file. 'pages_to_bytes' should be a non-negative integer");
            return {};
        }
        config.sampler.pages_to_bytes = doc["pages_to_bytes"].GetUint64();
    }

    if (doc.HasMember("interval_seconds"))
    {
        if (!doc["interval_seconds"].IsInt() || doc["interval_seconds"].GetInt() <= 0)
        {
            logger->error("Invalid config file. 'interval_seconds' should be a positive integer");
            return {};
        }
        config.interval_seconds = doc["interval_seconds"].GetInt();
    }

    return config;
}

auto AgentConfig::FromConfigFile(const char* file) -> std::optional<AgentConfig>
{
    if (access(file, R_OK) == -1)
    {
        Logger()->debug("No config file at {}, using defaults", file);
        return AgentConfig{};
    }

    StdIoFile fp{file};
    if (!fp)
    {
        Logger()->error("Unable to open config file {}", file);
        return {};
    }

    rapidjson::Document doc;
    char buf[64 * 1024];
    rapidjson::FileReadStream is(fp, buf, sizeof buf);
    doc.ParseStream(is);
    if (doc.HasParseError())
    {
        Logger()->error("Invalid config file {}. Parse error at offset {}: {}", file, doc.GetErrorOffset(),
                        rapidjson::GetParseError_En(doc.GetParseError()));
        return {};
    }

    return FromJson(doc);
}

}  // namespace procrate
