#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "config/settings.hpp"

namespace todo::cli {

enum ExitCode {
    kOk = 0,
    kFailure = 1,
    kUsage = 2,
};

// args excludes the program name. Exactly one action runs; the backing file
// is written only when that action changed the list.
int run(const std::vector<std::string>& args,
        const config::Settings& settings,
        std::ostream& out,
        std::ostream& err);

void print_usage(std::ostream& os);

}
