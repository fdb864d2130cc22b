#include "util/Logger.hpp"
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <format>

namespace sextant::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Kept open between writes
static std::string log_path = "/tmp/sextant.log";
static Logger::Level log_min_level = Logger::Level::Info;

static std::string default_log_path() {
    const char* env = std::getenv("SEXTANT_LOG");
    if (env && *env) {
        return env;
    }
    return "/tmp/sextant.log";
}

void Logger::init() {
    init(default_log_path());
}

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path = path;
    log_file.open(log_path, std::ios::trunc);
}

void Logger::set_min_level(Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_min_level = level;
}

Logger::Level Logger::min_level() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return log_min_level;
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (static_cast<int>(level) < static_cast<int>(log_min_level)) return;

    if (!log_file.is_open()) {
        // Not initialized: append so earlier runs are not clobbered
        log_file.open(log_path, std::ios::app);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    auto tm = *std::localtime(&now);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    log_file << std::put_time(&tm, "[%H:%M:%S] ");
    log_file << std::format("{}{}\n", level_str, message);
    log_file.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace sextant::util
