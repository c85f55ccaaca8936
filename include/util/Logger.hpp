#pragma once

#include <string>

namespace lyre::util {

// Not safe to call from the audio callback: every call takes a mutex and
// writes to disk.
class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    static void init();
    static void init(const std::string& path);
    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace lyre::util
