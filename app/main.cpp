#include "commands/add.hpp"
#include "commands/dump.hpp"
#include "commands/format.hpp"
#include "commands/validate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  positions validate [--file <path>] [--report <path>]\n"
        << "  positions dump [--file <path>] [--title <title>]\n"
        << "  positions format <spec-url> [options]\n"
        << "  positions add <spec-url> [options]\n"
        << "  positions help\n"
        << "\n"
        << "verbs:\n"
        << "  validate   check activities.json against the record schema\n"
        << "  dump       print entries of activities.json\n"
        << "  format     fetch a specification and print its entry as JSON\n"
        << "  add        add an entry to activities.json and create a GitHub issue\n"
        << "\n"
        << "network options (format, add):\n"
        << "  --http_mock <dir>            canned responses from <dir>/routes.json\n"
        << "  --http_workdir <dir>         default: private <tmp>/positions-http-XXXXXX\n"
        << "\n"
        << "To create GitHub issues, GH_USER and GH_TOKEN must be in the environment;\n"
        << "to generate a token, see <https://github.com/settings/tokens>. The 'repo'\n"
        << "permission is required.\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") return print_usage();

    if (cmd == "validate") return cmd_validate(argc - 1, argv + 1);
    if (cmd == "dump")     return cmd_dump(argc - 1, argv + 1);
    if (cmd == "format")   return cmd_format(argc - 1, argv + 1);
    if (cmd == "add")      return cmd_add(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
