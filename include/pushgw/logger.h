#pragma once

#include <fmt/core.h>

#include <iostream>
#include <mutex>
#include <string>
#include <utility>

namespace pushgw
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

class Logger
{
  public:
    static Logger& instance()
    {
        static Logger inst;
        return inst;
    }

    void set_level(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    [[nodiscard]] LogLevel level()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    void log(LogLevel level, const std::string& message)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_)
            return;

        std::string prefix;
        switch (level)
        {
            case LogLevel::Debug:
                prefix = "[DEBUG] ";
                break;
            case LogLevel::Info:
                prefix = "[INFO] ";
                break;
            case LogLevel::Warning:
                prefix = "[WARN] ";
                break;
            case LogLevel::Error:
                prefix = "[ERROR] ";
                break;
        }
        std::cout << prefix << message << std::endl;
    }

    template <typename... Args>
    void logf(LogLevel level, fmt::format_string<Args...> format, Args&&... args)
    {
        if (level < this->level())
            return;
        log(level, fmt::format(format, std::forward<Args>(args)...));
    }

  private:
    Logger() = default;
    std::mutex mutex_;
    LogLevel level_{LogLevel::Warning};
};

} // namespace pushgw

#define PUSHGW_LOG_DEBUG(...) ::pushgw::Logger::instance().logf(::pushgw::LogLevel::Debug, __VA_ARGS__)
#define PUSHGW_LOG_INFO(...) ::pushgw::Logger::instance().logf(::pushgw::LogLevel::Info, __VA_ARGS__)
#define PUSHGW_LOG_WARNING(...) ::pushgw::Logger::instance().logf(::pushgw::LogLevel::Warning, __VA_ARGS__)
#define PUSHGW_LOG_ERROR(...) ::pushgw::Logger::instance().logf(::pushgw::LogLevel::Error, __VA_ARGS__)
