#include "io/JsonIO.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::optional<std::string> optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::optional<std::int64_t> optional_int(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    if (!j.at(key).is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }
    if (j.at(key).is_number_unsigned() &&
        j.at(key).get<std::uint64_t>() > (std::uint64_t)std::numeric_limits<std::int64_t>::max()) {
        throw std::runtime_error(where + "." + std::string(key) + " is out of range");
    }
    return j.at(key).get<std::int64_t>();
}

template <typename T>
static json or_null(const std::optional<T>& v) {
    if (!v) return nullptr;
    return json(*v);
}

namespace positions {

json read_json_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open JSON file: " + path.string());

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }
    return j;
}

std::string dump_pretty(const json& j) {
    // nlohmann::json objects are std::map backed, so keys come out sorted
    return j.dump(2, ' ', true);
}

void write_json_file(const std::filesystem::path& path, const json& j) {
    // dump first: nlohmann throws on invalid UTF-8 and the target must survive that
    const std::string text = dump_pretty(j) + "\n";

    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out) throw std::runtime_error("failed to open for writing: " + tmp.string());
        out << text;
        out.close();
        if (!out) {
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            throw std::runtime_error("failed to write: " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw std::runtime_error("failed to replace " + path.string() + ": " + ec.message());
    }
}

json record_to_json(const PositionRecord& r) {
    json j = json::object();
    j["title"] = r.title;
    j["description"] = r.description;
    j["org"] = r.org;
    j["url"] = r.url;
    j["mozPosition"] = r.moz_position;
    j["ciuName"] = or_null(r.ciu_name);
    j["mozBugUrl"] = or_null(r.moz_bug_url);
    j["mozPositionIssue"] = or_null(r.moz_position_issue);
    j["mozPositionDetail"] = or_null(r.moz_position_detail);
    if (r.group) j["group"] = *r.group;
    return j;
}

PositionRecord record_from_json(const json& j, const std::string& where) {
    require_object(j, where);

    PositionRecord r;
    r.title               = require_string(j, "title", where);
    r.description         = require_string(j, "description", where);
    r.org                 = require_string(j, "org", where);
    r.url                 = require_string(j, "url", where);
    r.moz_position        = require_string(j, "mozPosition", where);
    r.ciu_name            = optional_string(j, "ciuName", where);
    r.group               = optional_string(j, "group", where);
    r.moz_bug_url         = optional_string(j, "mozBugUrl", where);
    r.moz_position_issue  = optional_int(j, "mozPositionIssue", where);
    r.moz_position_detail = optional_string(j, "mozPositionDetail", where);
    return r;
}

}  // namespace positions
