#include "log.hpp"

#include "utils/string_utils.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

todo::log::Level& global_level() {
    static todo::log::Level lvl = todo::log::Level::Info;
    return lvl;
}

std::atomic<bool>& env_init_flag() {
    static std::atomic<bool> f{false};
    return f;
}

std::unique_ptr<std::ofstream>& file_sink() {
    static std::unique_ptr<std::ofstream> f{};
    return f;
}

std::chrono::steady_clock::time_point& time_origin() {
    static auto t0 = std::chrono::steady_clock::now();
    return t0;
}

void init_from_env_once() {
    bool expected = false;
    if (!env_init_flag().compare_exchange_strong(expected, true)) {
        return;
    }
    if (const char* v = std::getenv("TODO_LOG_LEVEL")) {
        todo::log::Level parsed;
        if (todo::log::parse_level(v, parsed)) {
            global_level() = parsed;
        }
    }
}

const char* level_tag(todo::log::Level level) {
    switch (level) {
        case todo::log::Level::Error: return "ERROR";
        case todo::log::Level::Warn:  return "WARN";
        case todo::log::Level::Info:  return "INFO";
        case todo::log::Level::Debug: return "DEBUG";
        default:                      return "INFO";
    }
}

std::string elapsed_seconds() {
    using namespace std::chrono;
    const double secs = duration_cast<duration<double>>(steady_clock::now() - time_origin()).count();
    std::ostringstream ss;
    ss.setf(std::ios::fixed);
    ss << std::setprecision(3) << secs;
    return ss.str();
}

// stdout belongs to command output, so every level goes to stderr.
void log_line_impl(todo::log::Level level, const std::string& message) {
    init_from_env_once();
    if (static_cast<int>(level) > static_cast<int>(global_level())) {
        return;
    }
    std::lock_guard<std::mutex> lock(log_mutex());
    const std::string line = std::string("[") + level_tag(level) + "] +" + elapsed_seconds() + "s: " + message + '\n';
    std::cerr << line;
    std::cerr.flush();
    if (file_sink()) {
        (*file_sink()) << line;
        file_sink()->flush();
    }
}

}

namespace todo::log {

void set_level(Level level) {
    std::lock_guard<std::mutex> lock(log_mutex());
    global_level() = level;
}

Level level() {
    init_from_env_once();
    return global_level();
}

bool parse_level(const std::string& text, Level& out) {
    const std::string lower = strings::to_lower_copy(strings::trim_copy(text));
    if (lower == "error") { out = Level::Error; return true; }
    if (lower == "warn" || lower == "warning") { out = Level::Warn; return true; }
    if (lower == "info") { out = Level::Info; return true; }
    if (lower == "debug") { out = Level::Debug; return true; }
    return false;
}

bool set_file_sink(const std::string& path, bool append) {
    std::lock_guard<std::mutex> lock(log_mutex());
    file_sink().reset();
    if (path.empty()) {
        return true;
    }
    std::ios_base::openmode mode = std::ios::out;
    if (append) mode |= std::ios::app; else mode |= std::ios::trunc;
    auto ofs = std::make_unique<std::ofstream>(path, mode);
    if (!ofs->good()) {
        return false;
    }
    file_sink() = std::move(ofs);
    return true;
}

void error(const std::string& message) { log_line_impl(Level::Error, message); }
void warn (const std::string& message) { log_line_impl(Level::Warn,  message); }
void info (const std::string& message) { log_line_impl(Level::Info,  message); }
void debug(const std::string& message) { log_line_impl(Level::Debug, message); }

}
