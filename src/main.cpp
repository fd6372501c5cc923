#include "commands.hpp"
#include "config.hpp"
#include "crontab.hpp"
#include "util.hpp"
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: cronrepo <command> <dir> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  generate             Print the crontab block(s) for the job directory\n"
              << "  install              Write runner scripts and update the crontab\n"
              << "  uninstall            Remove the crontab block(s) and runner scripts\n"
              << "  list-inv             List job invocations in a time range\n"
              << "\n"
              << "Options:\n"
              << "  --target NAME        Only operate on this target (default: all)\n"
              << "  --trampoline CMD     Command wrapping each job ('' for none)\n"
              << "  --minlevel N         list-inv: skip jobs with a lower level\n"
              << "  --start TIME         list-inv: YYYY-mm-ddTHH:MM (default: now)\n"
              << "  --end TIME           list-inv: YYYY-mm-ddTHH:MM (default: start + 24h)\n"
              << "  --json               list-inv: print JSON instead of shell lines\n"
              << "  --config PATH        Config file (default: ~/.cronrepo/config.json)\n"
              << "  -h, --help           Show this help\n";
}

int main(int argc, char* argv[]) try {
    cronrepo::CommandOptions options;
    std::string config_path;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--target") == 0 && i + 1 < argc) {
            options.target = argv[++i];
        } else if (std::strcmp(argv[i], "--trampoline") == 0 && i + 1 < argc) {
            options.trampoline = argv[++i];
        } else if (std::strcmp(argv[i], "--minlevel") == 0 && i + 1 < argc) {
            if (!cronrepo::parse_uint(argv[++i], options.min_level)) {
                std::cerr << "Invalid --minlevel: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--start") == 0 && i + 1 < argc) {
            options.start = argv[++i];
        } else if (std::strcmp(argv[i], "--end") == 0 && i + 1 < argc) {
            options.end = argv[++i];
        } else if (std::strcmp(argv[i], "--json") == 0) {
            options.json = true;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else {
            positional.push_back(argv[i]);
        }
    }

    if (positional.size() != 2) {
        print_usage();
        return 1;
    }
    options.action = positional[0];
    options.dir = positional[1];

    auto config = config_path.empty() ? cronrepo::Config::load()
                                      : cronrepo::Config::load_from(config_path);
    cronrepo::SystemCrontab crontab;
    return cronrepo::run_command(options, config, crontab, std::cout);
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
