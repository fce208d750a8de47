#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace positions {

struct ValidationError {
    std::string code;     // not_a_list, missing_member, bad_url, ...
    std::string message;
    std::string entry;    // record label (title or "entry N"); empty for file-level errors
};

struct ValidationReport {
    bool pass = true;
    std::vector<ValidationError> errors;
};

// Checks the whole activities document: a list of record objects.
ValidationReport validate_document(const nlohmann::json& doc);

// Checks a single record object. `label` prefixes every message.
std::vector<ValidationError> validate_entry(const nlohmann::json& entry, const std::string& label = "Entry");

void write_validation_report(const std::filesystem::path& path, const ValidationReport& rep);

}  // namespace positions
