#include "commands/add.hpp"
#include "commands/CliArgs.hpp"

#include "github/IssueClient.hpp"
#include "io/JsonIO.hpp"
#include "positions/Validator.hpp"
#include "positions/ActivitiesFile.hpp"
#include "specs/SpecFetcher.hpp"

#include <iostream>
#include <string>

static int add_usage() {
    std::cerr
        << "usage:\n"
        << "  positions add <spec-url> [--file <path>] [--no_issue]\n"
        << "                [--http_mock <dir>] [--http_workdir <dir>]\n"
        << "\n"
        << "GH_USER and GH_TOKEN must be set to create the GitHub issue;\n"
        << "the token needs the 'repo' permission.\n";
    return 1;
}

int cmd_add(int argc, char** argv) {
    const std::string url = cli::positional(argc, argv, {"--file", "--http_mock", "--http_workdir"});
    if (url.empty() || cli::has_flag(argc, argv, "--help")) return add_usage();

    const std::string file = cli::get_arg(argc, argv, "--file", "activities.json");
    const bool no_issue    = cli::has_flag(argc, argv, "--no_issue");

    positions::ActivitiesFile activities(file);
    try {
        activities = positions::ActivitiesFile::load(file);
    } catch (const std::exception& e) {
        std::cerr << "* ERROR: " << e.what() << "\n";
        return 1;
    }

    const auto rep = activities.validate();
    if (!rep.pass) {
        for (const auto& e : rep.errors) std::cerr << "* ERROR: " << e.message << "\n";
        return 1;
    }

    try {
        auto http = cli::make_http_client(argc, argv);

        specs::SpecFetcher fetcher(*http, std::cerr);
        positions::PositionRecord entry = fetcher.fetch_record(url);

        activities.check_unique(entry);

        // only file an issue for an entry that will be saved
        const auto errors = positions::validate_entry(positions::record_to_json(entry), entry.title);
        if (!errors.empty()) {
            for (const auto& err : errors) std::cerr << "* ERROR: " << err.message << "\n";
            return 1;
        }

        if (!no_issue) {
            const auto number = github::create_issue(*http, github::GithubConfig::from_env(), entry, std::cerr);
            if (number) entry.moz_position_issue = *number;
        }

        activities.append(entry);
        activities.save();
        std::cerr << "* Added " << entry.title << " to " << file << "\n";
    } catch (const positions::InvalidEntryError& e) {
        for (const auto& err : e.errors()) std::cerr << "* ERROR: " << err.message << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "* ERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
