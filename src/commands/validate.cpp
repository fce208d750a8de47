#include "commands/validate.hpp"
#include "commands/CliArgs.hpp"

#include "positions/ActivitiesFile.hpp"
#include "positions/Validator.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int validate_usage() {
    std::cerr
        << "usage:\n"
        << "  positions validate [--file <path>] [--report <path>]\n";
    return 1;
}

int cmd_validate(int argc, char** argv) {
    if (cli::has_flag(argc, argv, "--help")) return validate_usage();

    const std::string file        = cli::get_arg(argc, argv, "--file", "activities.json");
    const std::string report_path = cli::get_arg(argc, argv, "--report", "");

    positions::ValidationReport rep;
    size_t count = 0;
    try {
        const auto activities = positions::ActivitiesFile::load(file);
        rep = activities.validate();
        count = activities.size();
    } catch (const std::exception& e) {
        std::cerr << "* ERROR: " << e.what() << "\n";
        return 1;
    }

    if (!report_path.empty()) {
        try {
            positions::write_validation_report(fs::path(report_path), rep);
        } catch (const std::exception& e) {
            std::cerr << "[error] " << e.what() << "\n";
            return 1;
        }
    }

    if (!rep.pass) {
        for (const auto& e : rep.errors) {
            std::cerr << "* ERROR: " << e.message << "\n";
        }
        return 1;
    }

    std::cout << "VALIDATION: pass (" << count << " entries)\n";
    if (!report_path.empty()) std::cout << "OUT_VALIDATE: " << report_path << "\n";
    return 0;
}
