#pragma once

#include "proc_records.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace procrate
{

// Location of the proc filesystem and the names of the files read under each
// <pid> directory. Overridable so tests can point at a fixture tree.
struct ProcFiles
{
    std::string path{"/proc"};
    std::string uptime{"uptime"};
    std::string stat{"stat"};
    std::string statm{"statm"};
    std::string status{"status"};
    std::string cmdline{"cmdline"};
    std::string wchan{"wchan"};
    std::string fd{"fd"};
    std::string io{"io"};
};

// Kinds of per-process files, in the order a full read visits them
enum class DetailKind
{
    Statm,
    Stat,
    Io,
    Owner,
    Cmdline,
    Wchan,
    Fd,
};

enum class ReadScope
{
    Baseline,  // counters, io and start time only
    Full,
};

class ProcfsReader
{
   public:
    explicit ProcfsReader(ProcFiles files = {}) noexcept;

    // Seconds since boot. Throws EnumerationFailure if the file is unreadable.
    double read_uptime() const;
    // Numeric entries under the proc root. Throws EnumerationFailure if the
    // directory cannot be opened.
    std::vector<pid_t> list_processes() const;
    // Wall clock, in seconds since the epoch
    double capture_time() const;

    std::optional<StatFields> read_stat(pid_t pid) const;
    IoCounters read_io(pid_t pid) const;
    std::optional<MemoryPages> read_memory(pid_t pid) const;
    std::optional<std::string> read_owner(pid_t pid) const;
    std::optional<std::string> read_cmdline(pid_t pid) const;
    std::optional<std::string> read_wchan(pid_t pid) const;
    std::map<std::string, std::string> read_fds(pid_t pid) const;

    // Read every file the scope needs. Returns nullopt when a mandatory file is
    // gone, which happens when the process exits while we scan it.
    std::optional<RawProcessRecord> read_process(pid_t pid, ReadScope scope, double uptime) const;

    [[nodiscard]] const ProcFiles& files() const noexcept { return files_; }

   private:
    std::string pid_dir(pid_t pid) const;

    ProcFiles files_;
};

// Parse the contents of a /proc/<pid>/stat line. The command name sits between
// the first '(' and the last ')' and may contain both spaces and parentheses.
std::optional<StatFields> parse_stat_line(const std::string& line);

// D:HH:MM:SS, e.g. 1:02:03:04
std::string format_active_time(int64_t seconds);

}  // namespace procrate
