#pragma once

#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "positions/Models.hpp"

namespace positions {

nlohmann::json read_json_file(const std::filesystem::path& path);

// indent 2, keys sorted, non-ASCII escaped, trailing newline
void write_json_file(const std::filesystem::path& path, const nlohmann::json& j);

// every schema member is emitted; missing optional values become null
nlohmann::json record_to_json(const PositionRecord& r);

// `j` is expected to have passed validate_entry; type mismatches throw
PositionRecord record_from_json(const nlohmann::json& j, const std::string& where = "entry");

std::string dump_pretty(const nlohmann::json& j);

}  // namespace positions
