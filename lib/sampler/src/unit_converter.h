#pragma once

#include <lib/procfs/src/proc_records.h>

#include <cstdint>

namespace procrate
{

enum class MemoryUnit
{
    Pages,
    Kilobytes,
    Bytes,
};

// Converts /proc/<pid>/statm sizes, which the kernel reports in pages. Only
// memory sizes go through here, never rates.
class UnitConverter
{
   public:
    static constexpr uint64_t DefaultPageSize{4096};

    // factor 0 leaves values in pages; otherwise every value is multiplied by it
    // (4 gives kilobytes and 4096 gives bytes on a 4 KiB page system)
    explicit UnitConverter(uint64_t factor = 0, uint64_t page_size = DefaultPageSize) noexcept
        : factor_{factor}, page_size_{page_size}
    {
    }

    static UnitConverter ForUnit(MemoryUnit unit, uint64_t page_size = system_page_size()) noexcept;
    static uint64_t system_page_size() noexcept;

    [[nodiscard]] uint64_t convert(uint64_t pages) const noexcept;
    [[nodiscard]] uint64_t convert(uint64_t pages, MemoryUnit unit) const noexcept;
    [[nodiscard]] MemoryPages convert(const MemoryPages& pages) const noexcept;

    [[nodiscard]] uint64_t factor() const noexcept { return factor_; }

   private:
    uint64_t factor_;
    uint64_t page_size_;
};

}  // namespace procrate
