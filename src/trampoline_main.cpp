#include "config.hpp"
#include "trampoline.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

static void print_usage() {
    std::cerr << "Usage: cronrepo-run [-n|--no-notify] <job-file> [args...]\n"
              << "\n"
              << "Runs a job with its output in <LOG>/<name>.log and leaves\n"
              << "<name>.running, then <name>.completed or <name>.failed, beside it.\n"
              << "LOG, NOTIFY and ROTATE are read from .cronrepo.conf in the job's\n"
              << "directory, falling back to \"run\" in ~/.cronrepo/config.json.\n";
}

int main(int argc, char* argv[]) try {
    cronrepo::TrampolineRequest request;

    int i = 1;
    for (; i < argc; i++) {
        if (std::strcmp(argv[i], "-n") == 0 || std::strcmp(argv[i], "--no-notify") == 0) {
            request.notify = false;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--") == 0) {
            ++i;
            break;
        } else {
            break;
        }
    }
    if (i >= argc) {
        print_usage();
        return 2;
    }
    request.job_file = argv[i++];
    for (; i < argc; i++) request.args.push_back(argv[i]);
    if (const char* jid = std::getenv("CRONREPO_JID")) request.job_id = jid;

    auto config = cronrepo::Config::load();
    cronrepo::PosixSignalShield signals;
    cronrepo::Trampoline trampoline(
        cronrepo::load_run_config(request.job_file, config.run), signals);
    return trampoline.run(request);
} catch (const cronrepo::TrampolineSetupError& e) {
    std::cerr << "[trampoline] " << e.what() << '\n';
    return 2;
} catch (const std::exception& e) {
    std::cerr << "[trampoline] Fatal error: " << e.what() << '\n';
    return 2;
}
