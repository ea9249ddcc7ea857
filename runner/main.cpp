#include "cmd_host.h"

#include <iostream>
#include <string>

static void usage() {
    std::cerr << "kestrel_host <command> ...\n"
              << "  run                        start the host daemon\n"
              << "  check-mounts <folder>      validate a group's additional mounts\n"
              << "  cron-next <expr> [tz] [n]  print the next run time(s) of a cron expression\n"
              << "  tasks [folder]             list persisted scheduled tasks\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "check-mounts") return cmd_check_mounts(argc, argv);
    if (cmd == "cron-next") return cmd_cron_next(argc, argv);
    if (cmd == "tasks") return cmd_tasks(argc, argv);
    if (cmd == "-h" || cmd == "--help" || cmd == "help") {
        usage();
        return 0;
    }
    std::cerr << "unknown command: " << cmd << "\n";
    usage();
    return 2;
}
