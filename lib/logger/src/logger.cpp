#include "logger.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <sys/stat.h>
#include <unistd.h>

namespace procrate
{

static constexpr const char* const kMainLogger = "main_logger";
static constexpr const char* const kLogFileName = "procrate.log";
static constexpr size_t kMaxLogFileSize = 1024 * 1024;
static constexpr size_t kMaxLogFiles = 8;

static bool is_writable_dir(const std::string& dir)
{
    struct stat dir_stat;
    const char* cdir = dir.c_str();
    if (stat(cdir, &dir_stat) != 0 || !S_ISDIR(dir_stat.st_mode))
    {
        mkdir(cdir, 0777);
    }

    bool error = stat(cdir, &dir_stat) != 0;                        // couldn't even stat it
    error |= !S_ISDIR(dir_stat.st_mode);                            // or not a dir
    error |= S_ISDIR(dir_stat.st_mode) && access(cdir, W_OK) != 0;  // dir, but can't write to it
    return !error;
}

static std::string join_path(const std::string& dir, const char* file_name)
{
    if (dir.empty())
    {
        return fmt::format("./{}", file_name);
    }
    if (dir.back() == '/')
    {
        return fmt::format("{}{}", dir, file_name);
    }
    return fmt::format("{}/{}", dir, file_name);
}

static std::shared_ptr<spdlog::logger> create_console_logger(const char* name)
{
    auto existing = spdlog::get(name);
    if (existing)
    {
        return existing;
    }
    return spdlog::stderr_color_mt(name);
}

LogManager& log_manager() noexcept
{
    static auto* the_log_manager = new LogManager();
    return *the_log_manager;
}

LogManager::LogManager() noexcept
{
    try
    {
        spdlog::set_error_handler([](const std::string& msg) { std::cerr << "Log error: " << msg << "\n"; });
        logger_ = create_console_logger(kMainLogger);
    }
    catch (const spdlog::spdlog_ex& ex)
    {
        std::cerr << "Log initialization failed: " << ex.what() << "\n";
    }
}

std::shared_ptr<spdlog::logger> LogManager::Logger() noexcept { return logger_; }

void LogManager::UseFileLogger(const std::string& dir) noexcept
{
    if (!is_writable_dir(dir))
    {
        logger_->warn("Log directory {} is not writable, keeping console logger", dir);
        return;
    }

    try
    {
        auto level = logger_->level();
        spdlog::drop(kMainLogger);
        logger_ = spdlog::rotating_logger_mt(kMainLogger, join_path(dir, kLogFileName), kMaxLogFileSize,
                                             kMaxLogFiles);
        logger_->set_level(level);
        logger_->flush_on(spdlog::level::info);
    }
    catch (const spdlog::spdlog_ex& ex)
    {
        std::cerr << "Unable to log to " << dir << ": " << ex.what() << "\n";
        logger_ = create_console_logger(kMainLogger);
    }
}

void LogManager::UseConsoleLogger() noexcept
{
    try
    {
        spdlog::drop(kMainLogger);
        logger_ = spdlog::stdout_color_mt(kMainLogger);
        logger_->set_level(spdlog::level::debug);
    }
    catch (const spdlog::spdlog_ex& ex)
    {
        std::cerr << "Unable to create console logger: " << ex.what() << "\n";
    }
}

void LogManager::SetLevel(spdlog::level::level_enum level) noexcept { logger_->set_level(level); }

}  // namespace procrate
