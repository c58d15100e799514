#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: log.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Түвшинтэй лог. Job worker-ууд зэрэг бичихэд мөрүүд холилдохгүй,
            алдаа болон анхааруулга stderr руу, бусад нь stdout руу гарна.
*/


#include <iostream>
#include <mutex>
#include <string>

namespace gpurt
{
    enum class LogLevel
    {
        Info,
        Warn,
        Error
    };

    inline const char* log_level_tag(LogLevel level)
    {
        switch (level)
        {
            case LogLevel::Info: return "INFO";
            case LogLevel::Warn: return "WARN";
            case LogLevel::Error: return "ERROR";
        }
        return "INFO";
    }

    // "[gpurt:WARN] message"
    inline std::string format_log_line(LogLevel level, const std::string& msg)
    {
        std::string line = "[gpurt:";
        line += log_level_tag(level);
        line += "] ";
        line += msg;
        return line;
    }

    inline void log_line(LogLevel level, const std::string& msg)
    {
        static std::mutex write_lock;
        const std::string line = format_log_line(level, msg);
        std::ostream& out = level == LogLevel::Info ? std::cout : std::cerr;
        std::lock_guard<std::mutex> guard(write_lock);
        out << line << std::endl;
    }

    inline void log_info(const std::string& msg) { log_line(LogLevel::Info, msg); }
    inline void log_warn(const std::string& msg) { log_line(LogLevel::Warn, msg); }
    inline void log_error(const std::string& msg) { log_line(LogLevel::Error, msg); }
}
