#pragma once

#include <lib/logger/src/logger.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <dirent.h>

namespace procrate
{

// Read-only FILE* that closes itself. Files under /proc disappear whenever a
// process exits, so a failed open is only logged at debug level.
class StdIoFile
{
   public:
    explicit StdIoFile(const char* name) noexcept : fp_(std::fopen(name, "r"))
    {
        if (fp_ == nullptr)
        {
            Logger()->debug("Unable to open {}: {}", name, strerror(errno));
        }
    }
    StdIoFile(const StdIoFile&) = delete;
    StdIoFile& operator=(const StdIoFile&) = delete;
    StdIoFile(StdIoFile&& other) noexcept : fp_(other.fp_) { other.fp_ = nullptr; }

    ~StdIoFile()
    {
        if (fp_ != nullptr)
        {
            std::fclose(fp_);
            fp_ = nullptr;
        }
    }

    operator FILE*() const { return fp_; }

   private:
    FILE* fp_;
};

class DirHandle
{
   public:
    explicit DirHandle(const char* name) noexcept : dh_{opendir(name)}
    {
        if (dh_ == nullptr)
        {
            Logger()->debug("Unable to opendir {}: {}", name, strerror(errno));
        }
    }
    DirHandle(const DirHandle&) = delete;
    DirHandle& operator=(const DirHandle&) = delete;
    ~DirHandle()
    {
        if (dh_ != nullptr)
        {
            closedir(dh_);
        }
    }

    operator DIR*() const { return dh_; }

   private:
    DIR* dh_;
};

}  // namespace procrate
