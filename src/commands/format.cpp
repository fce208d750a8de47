#include "commands/format.hpp"
#include "commands/CliArgs.hpp"

#include "io/JsonIO.hpp"
#include "specs/SpecFetcher.hpp"

#include <iostream>
#include <string>

static int format_usage() {
    std::cerr
        << "usage:\n"
        << "  positions format <spec-url> [--http_mock <dir>] [--http_workdir <dir>]\n";
    return 1;
}

int cmd_format(int argc, char** argv) {
    const std::string url = cli::positional(argc, argv, {"--http_mock", "--http_workdir"});
    if (url.empty() || cli::has_flag(argc, argv, "--help")) return format_usage();

    try {
        auto http = cli::make_http_client(argc, argv);
        specs::SpecFetcher fetcher(*http, std::cerr);
        const positions::PositionRecord r = fetcher.fetch_record(url);
        std::cout << positions::dump_pretty(positions::record_to_json(r)) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "* ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
