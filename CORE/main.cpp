#include "cli/commands.hpp"
#include "config/settings.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    const todo::config::Settings settings = todo::config::load_settings();
    todo::config::apply_logging(settings);

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return todo::cli::run(args, settings, std::cout, std::cerr);
}
