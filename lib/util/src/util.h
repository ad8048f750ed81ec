#pragma once

#include <lib/files/src/files.h>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace procrate
{

StdIoFile open_file(const std::string& prefix, const char* name);

std::vector<std::vector<std::string>> read_lines_fields(const std::string& prefix, const char* fn);

// Parse lines of the form "key value" or "key: value" into stats. Lines that do
// not end in an integer are ignored.
void parse_kv_from_file(const std::string& prefix, const char* fn, std::unordered_map<std::string, int64_t>* stats);

bool starts_with(const char* line, const char* prefix) noexcept;

bool all_digits(const char* str) noexcept;

// parse a string of the form key=val,key2=val2 into a map of tags
std::unordered_map<std::string, std::string> parse_tags(const char* s);

}  // namespace procrate
