#pragma once

#include <iostream>
#include <string>
#include <mutex>

namespace PriceSync {

/**
 * @brief Thread-safe console logger for the reconciliation engine.
 *
 * Messages below the configured threshold are dropped. The sink defaults to
 * std::cout and can be redirected (tests capture or silence it).
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static void log(Level level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex());
        if (static_cast<int>(level) < static_cast<int>(threshold())) return;

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;90m"; prefix = "... "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
        }

        std::ostream& out = *sink();
        if (colored()) {
            out << color << prefix << message << "\033[0m" << std::endl;
        } else {
            out << prefix << message << std::endl;
        }
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

    static void set_level(Level level) {
        std::lock_guard<std::mutex> lock(mutex());
        threshold() = level;
    }

    /**
     * @brief Redirect output. Colour codes are disabled for anything but std::cout.
     */
    static void set_sink(std::ostream& out) {
        std::lock_guard<std::mutex> lock(mutex());
        sink() = &out;
        colored() = (&out == &std::cout);
    }

private:
    static std::mutex& mutex() {
        static std::mutex m;
        return m;
    }

    static Level& threshold() {
        static Level level = Level::Info;
        return level;
    }

    static std::ostream*& sink() {
        static std::ostream* out = &std::cout;
        return out;
    }

    static bool& colored() {
        static bool on = true;
        return on;
    }
};

} // namespace PriceSync
