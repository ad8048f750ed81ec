#pragma once

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace procrate
{

class LogManager
{
   public:
    LogManager() noexcept;
    std::shared_ptr<spdlog::logger> Logger() noexcept;

    // Replace the main logger with a rotating file logger under dir. Falls back
    // to stderr if the directory is not writable.
    void UseFileLogger(const std::string& dir) noexcept;
    void UseConsoleLogger() noexcept;
    void SetLevel(spdlog::level::level_enum level) noexcept;

   private:
    std::shared_ptr<spdlog::logger> logger_;
};

LogManager& log_manager() noexcept;

inline std::shared_ptr<spdlog::logger> Logger() noexcept { return log_manager().Logger(); }

}  // namespace procrate
