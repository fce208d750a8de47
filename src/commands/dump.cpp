#include "commands/dump.hpp"
#include "commands/CliArgs.hpp"

#include "positions/ActivitiesFile.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

static std::string show(const std::optional<std::string>& v) {
    return v ? *v : std::string("null");
}

static void print_record(const positions::PositionRecord& r) {
    std::cout << "[" << r.org << "] " << r.title << "\n";
    std::cout << "  url: " << r.url << "\n";
    std::cout << "  mozPosition: " << r.moz_position << "\n";
    std::cout << "  mozPositionIssue: ";
    if (r.moz_position_issue) std::cout << *r.moz_position_issue;
    else std::cout << "null";
    std::cout << "\n";
    std::cout << "  mozPositionDetail: " << show(r.moz_position_detail) << "\n";
    std::cout << "  mozBugUrl: " << show(r.moz_bug_url) << "\n";
    std::cout << "  ciuName: " << show(r.ciu_name) << "\n";
    if (r.group) std::cout << "  group: " << *r.group << "\n";
    std::cout << "  " << r.description << "\n";
    std::cout << "\n";
}

int cmd_dump(int argc, char** argv) {
    const std::string file  = cli::get_arg(argc, argv, "--file", "activities.json");
    const std::string title = cli::get_arg(argc, argv, "--title", "");

    std::vector<positions::PositionRecord> records;
    try {
        const auto activities = positions::ActivitiesFile::load(file);
        const auto rep = activities.validate();
        if (!rep.pass) {
            std::cerr << "[error] " << file << " does not validate; run `positions validate`\n";
            return 1;
        }

        if (!title.empty()) {
            auto r = activities.find_by_title(title);
            if (!r) {
                std::cerr << "[error] no entry titled \"" << title << "\"\n";
                return 1;
            }
            records.push_back(*r);
        } else {
            records = activities.records();
        }
    } catch (const std::exception& e) {
        std::cerr << "[error] failed to load activities: " << e.what() << "\n";
        return 1;
    }

    for (const auto& r : records) print_record(r);
    return 0;
}
