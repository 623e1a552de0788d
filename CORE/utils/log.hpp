#pragma once

#include <string>

namespace todo::log {

enum class Level {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

void set_level(Level level);
Level level();

// Accepts "error", "warn"/"warning", "info", "debug" in any case; returns false otherwise.
bool parse_level(const std::string& text, Level& out);

// Mirrors every emitted line into path; an empty path closes the sink.
// Returns false when the file cannot be opened.
bool set_file_sink(const std::string& path, bool append);

void error(const std::string& message);
void warn(const std::string& message);
void info(const std::string& message);
void debug(const std::string& message);

}
