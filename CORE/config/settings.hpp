#pragma once

#include <filesystem>
#include <functional>
#include <string>

#include "utils/log.hpp"

namespace todo::config {

constexpr const char* kDefaultFileName = "todo_list.json";
constexpr const char* kFileEnv = "TODO_FILE";
constexpr const char* kLogLevelEnv = "TODO_LOG_LEVEL";
constexpr const char* kLogFileEnv = "TODO_LOG_FILE";
constexpr const char* kLogAppendEnv = "TODO_LOG_APPEND";

struct Settings {
    std::filesystem::path file;
    log::Level log_level = log::Level::Warn;
    bool log_level_from_env = false;
    std::string log_file;
    bool log_append = false;
};

using EnvLookup = std::function<const char*(const char*)>;

Settings load_settings();
Settings load_settings(const EnvLookup& env);

// Applies log_level unless TODO_LOG_LEVEL already chose one, then opens the log file if any.
void apply_logging(const Settings& settings);

}
