#pragma once

#include <string>

namespace sextant::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Opens the log file (SEXTANT_LOG if set, /tmp/sextant.log otherwise)
    static void init();
    static void init(const std::string& path);

    static void set_min_level(Level level);
    static Level min_level();

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace sextant::util
