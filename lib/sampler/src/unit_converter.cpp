#include "unit_converter.h"

#include <unistd.h>

namespace procrate
{

UnitConverter UnitConverter::ForUnit(MemoryUnit unit, uint64_t page_size) noexcept
{
    switch (unit)
    {
        case MemoryUnit::Kilobytes:
            return UnitConverter{page_size / 1024, page_size};
        case MemoryUnit::Bytes:
            return UnitConverter{page_size, page_size};
        case MemoryUnit::Pages:
        default:
            return UnitConverter{0, page_size};
    }
}

uint64_t UnitConverter::system_page_size() noexcept
{
    auto page_size = sysconf(_SC_PAGESIZE);
    return page_size > 0 ? static_cast<uint64_t>(page_size) : DefaultPageSize;
}

uint64_t UnitConverter::convert(uint64_t pages) const noexcept { return factor_ == 0 ? pages : pages * factor_; }

uint64_t UnitConverter::convert(uint64_t pages, MemoryUnit unit) const noexcept
{
    switch (unit)
    {
        case MemoryUnit::Kilobytes:
            return pages * page_size_ / 1024;
        case MemoryUnit::Bytes:
            return pages * page_size_;
        case MemoryUnit::Pages:
        default:
            return pages;
    }
}

MemoryPages UnitConverter::convert(const MemoryPages& pages) const noexcept
{
    MemoryPages result;
    result.size = convert(pages.size);
    result.resident = convert(pages.resident);
    result.share = convert(pages.share);
    result.trs = convert(pages.trs);
    result.lrs = convert(pages.lrs);
    result.drs = convert(pages.drs);
    result.dtp = convert(pages.dtp);
    return result;
}

}  // namespace procrate
