#include "commands/agent.hpp"
#include "commands/normalize.hpp"
#include "commands/strip.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  jobjumper normalize --kind <kind> [--in <path>] [args]\n"
        << "  jobjumper agent --kind <kind> --mock <dir> --id <request_id> [args]\n"
        << "  jobjumper strip [--in <path>] [--out <path>]\n"
        << "  jobjumper help\n"
        << "\n"
        << "kinds: match, fit, research, prep, resume, document\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        return print_usage();
    }

    if (cmd == "normalize") return cmd_normalize(argc - 1, argv + 1);
    if (cmd == "agent")     return cmd_agent(argc - 1, argv + 1);
    if (cmd == "strip")     return cmd_strip(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
