#include "util.h"

#include <absl/strings/str_split.h>
#include <cinttypes>
#include <fstream>

namespace procrate
{

StdIoFile open_file(const std::string& prefix, const char* name)
{
    auto resolved_path = fmt::format("{}/{}", prefix, name);
    return StdIoFile(resolved_path.c_str());
}

std::vector<std::vector<std::string>> read_lines_fields(const std::string& prefix, const char* fn)
{
    std::vector<std::vector<std::string>> result;
    std::string fp = fmt::format("{}/{}", prefix, fn);
    std::ifstream in(fp);

    if (!in)
    {
        Logger()->debug("Unable to open {}", fp);
        return result;
    }

    std::string line;
    while (std::getline(in, line))
    {
        result.push_back(absl::StrSplit(line, absl::ByAnyChar(" \t"), absl::SkipEmpty()));
    }

    return result;
}

void parse_kv_from_file(const std::string& prefix, const char* fn, std::unordered_map<std::string, int64_t>* stats)
{
    auto fp = open_file(prefix, fn);
    if (fp == nullptr)
    {
        return;
    }

    char buffer[1024];
    char key[1024];
    int64_t value;
    while (fgets(buffer, sizeof buffer, fp) != nullptr)
    {
        if (sscanf(buffer, "%1023s %" SCNd64, key, &value) == 2)
        {
            std::string str_key{key};
            if (!str_key.empty() && str_key.back() == ':')
            {
                str_key.pop_back();
            }
            (*stats)[str_key] = value;
        }
    }
}

bool starts_with(const char* line, const char* prefix) noexcept
{
    auto prefix_len = std::strlen(prefix);
    auto line_len = std::strlen(line);
    if (line_len < prefix_len)
    {
        return false;
    }

    return std::memcmp(line, prefix, prefix_len) == 0;
}

bool all_digits(const char* str) noexcept
{
    if (*str == '\0')
    {
        return false;
    }

    for (; *str != '\0'; ++str)
    {
        if (!isdigit(static_cast<unsigned char>(*str))) return false;
    }
    return true;
}

std::unordered_map<std::string, std::string> parse_tags(const char* s)
{
    std::unordered_map<std::string, std::string> tags{};
    std::vector<absl::string_view> fields = absl::StrSplit(s, absl::ByAnyChar(", "), absl::SkipEmpty());
    for (const auto& f : fields)
    {
        auto pos = f.find('=');
        if (pos != absl::string_view::npos)
        {
            std::string key = std::string(f.substr(0, pos));
            std::string value = std::string(f.substr(pos + 1));
            if (!key.empty() && !value.empty())
            {
                tags[key] = value;
            }
        }
    }
    return tags;
}

}  // namespace procrate
