#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace FemCanon {

/**
 * @brief Thread-safe console logger shared by the library and the tools.
 *
 * Messages below the threshold are dropped, which is how `--quiet` and the
 * test suites keep the console clean.
 */
class Logger {
public:
    enum class Level {
        Step = 0,
        Info,
        Success,
        Warning,
        Error,
        Silent
    };

    static void set_threshold(Level level) { threshold().store(level); }

    static void log(Level level, const std::string& message) {
        if (level < threshold().load()) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
            case Level::Silent:  return;
        }

        std::clog << color << prefix << message << "\033[0m" << std::endl;
    }

    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<Level>& threshold() {
        static std::atomic<Level> level{Level::Step};
        return level;
    }
};

} // namespace FemCanon
