#pragma once
#include <string>
#include <cstdio>
#include <mutex>

namespace csp {
enum class LogLevel { Debug = 0, Info, Warn, Error };

class Logger {
public:
    static void set_level(LogLevel lv) {
        std::lock_guard<std::mutex> lk(mu_);
        level_ = lv;
    }

    static LogLevel level() {
        std::lock_guard<std::mutex> lk(mu_);
        return level_;
    }

    // "debug" | "info" | "warn" | "error"; false leaves the level untouched
    static bool set_level(const std::string& name) {
        if (name == "debug") set_level(LogLevel::Debug);
        else if (name == "info") set_level(LogLevel::Info);
        else if (name == "warn") set_level(LogLevel::Warn);
        else if (name == "error") set_level(LogLevel::Error);
        else return false;
        return true;
    }

    template <typename... Args>
    static void debug(const char* fmt, Args... args) {
        write(LogLevel::Debug, stdout, "[D] ", fmt, args...);
    }

    template <typename... Args>
    static void info(const char* fmt, Args... args) {
        write(LogLevel::Info, stdout, "[I] ", fmt, args...);
    }

    template <typename... Args>
    static void warn(const char* fmt, Args... args) {
        write(LogLevel::Warn, stderr, "[W] ", fmt, args...);
    }

    template <typename... Args>
    static void error(const char* fmt, Args... args) {
        write(LogLevel::Error, stderr, "[E] ", fmt, args...);
    }

private:
    template <typename... Args>
    static void write(LogLevel lv, FILE* out, const char* tag, const char* fmt, Args... args) {
        std::lock_guard<std::mutex> lk(mu_);
        if (lv < level_) return;
        const std::string line = std::string(tag) + fmt + "\n";
        if constexpr (sizeof...(Args) == 0) {
            fputs(line.c_str(), out);
        } else {
            fprintf(out, line.c_str(), args...);
        }
    }

    static inline std::mutex mu_{};
    static inline LogLevel level_{LogLevel::Info};
};
}
