#pragma once
#include <ctime>
#include <filesystem>
#include <mutex>
#include <string>

namespace WebAsset {
    enum class LogLevel {
        Debug,
        Info,
        Warn,
        Error
    };

    const char* ToString(LogLevel level);

    // Process-wide logger. Writes to the console and, once Init() has been
    // called, to <base_dir>/logs/webasset-YYYY-MM-DD.log.
    class Logger {
    public:
        static void Init(const std::string& base_dir, LogLevel min_level);
        static void SetMinLevel(LogLevel level);
        static LogLevel MinLevel();
        static void SetConsoleOutput(bool enabled);
        static LogLevel FromString(const std::string& s);
        static void Log(LogLevel level, const std::string& message);
    private:
        static std::mutex log_mutex;
        static LogLevel min_level_;
        static bool console_enabled_;
        static std::filesystem::path logs_dir_;
        static std::string current_date_;
        static void EnsureLogFileUnlocked(const std::tm& now_tm);
        static void OpenLogFileForDate(const std::string& date);
    };
}
