#include "config/settings.hpp"

#include <cstdlib>
#include <system_error>

namespace todo::config {
namespace {

bool is_truthy(const char* v) {
    return v && (*v == '1' || *v == 'y' || *v == 'Y' || *v == 't' || *v == 'T');
}

}

Settings load_settings() {
    return load_settings([](const char* name) { return std::getenv(name); });
}

Settings load_settings(const EnvLookup& env) {
    Settings settings;

    const char* file = env(kFileEnv);
    if (file && *file) {
        settings.file = std::filesystem::path(file);
    } else {
        // The working directory may be gone; a relative path still lets the file layer report it.
        std::error_code ec;
        const auto cwd = std::filesystem::current_path(ec);
        settings.file = ec ? std::filesystem::path(kDefaultFileName) : cwd / kDefaultFileName;
    }

    if (const char* lvl = env(kLogLevelEnv)) {
        log::Level parsed;
        if (log::parse_level(lvl, parsed)) {
            settings.log_level = parsed;
            settings.log_level_from_env = true;
        }
    }

    if (const char* log_file = env(kLogFileEnv)) {
        settings.log_file = log_file;
    }
    settings.log_append = is_truthy(env(kLogAppendEnv));
    return settings;
}

void apply_logging(const Settings& settings) {
    if (!settings.log_level_from_env) {
        log::set_level(settings.log_level);
    }
    if (!settings.log_file.empty() && !log::set_file_sink(settings.log_file, settings.log_append)) {
        log::warn("config: unable to open log file '" + settings.log_file + "'");
    }
}

}
