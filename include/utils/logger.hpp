#pragma once

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace RdfPg {

/**
 * @brief Thread-safe logging utility for the store and its tools.
 *
 * Messages below the current threshold are dropped. The initial threshold
 * is Info, or Debug when RDFPG_LOG_LEVEL=debug is set in the environment.
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    static void set_level(Level level) { threshold() = level; }
    static Level level() { return threshold(); }

    static bool enabled(Level level) {
        return static_cast<int>(level) >= static_cast<int>(threshold().load());
    }

    static void log(Level level, const std::string& message) {
        if (!enabled(level)) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;35m"; prefix = "[rdfpg] ";   break; // Magenta
            case Level::Info:    color = "\033[0;36m"; prefix = "=== ";       break; // Cyan
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";         break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";         break; // Red
        }

        std::cerr << color << prefix << message << "\033[0m" << std::endl;
    }

    static void debug(const std::string& msg) { log(Level::Debug, msg); }
    static void info(const std::string& msg)  { log(Level::Info, msg); }
    static void warn(const std::string& msg)  { log(Level::Warning, msg); }
    static void error(const std::string& msg) { log(Level::Error, msg); }

private:
    static std::atomic<Level>& threshold() {
        static std::atomic<Level> level{initial_level()};
        return level;
    }

    static Level initial_level() {
        const char* env = std::getenv("RDFPG_LOG_LEVEL");
        if (env && std::string(env) == "debug") return Level::Debug;
        return Level::Info;
    }
};

} // namespace RdfPg
