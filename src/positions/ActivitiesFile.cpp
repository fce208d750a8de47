#include "positions/ActivitiesFile.hpp"

#include "io/JsonIO.hpp"

#include <cctype>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace positions {

static std::string title_key(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace((unsigned char)s[i])) ++i;
    size_t j = s.size();
    while (j > i && std::isspace((unsigned char)s[j - 1])) --j;

    std::string out = s.substr(i, j - i);
    for (char& c : out) c = (char)std::tolower((unsigned char)c);
    return out;
}

static std::string first_message(const std::vector<ValidationError>& errors) {
    if (errors.empty()) return "invalid entry";
    return errors.front().message;
}

InvalidEntryError::InvalidEntryError(std::vector<ValidationError> errors)
    : std::runtime_error(first_message(errors)), errors_(std::move(errors)) {}

ActivitiesFile::ActivitiesFile(fs::path path) : path_(std::move(path)) {}

ActivitiesFile ActivitiesFile::load(const fs::path& path) {
    ActivitiesFile f(path);
    try {
        f.data_ = read_json_file(path);
    } catch (const std::exception& e) {
        throw std::runtime_error("Can't load " + path.string() + ": " + e.what());
    }
    return f;
}

ValidationReport ActivitiesFile::validate() const {
    return validate_document(data_);
}

void ActivitiesFile::check_unique(const PositionRecord& r) const {
    if (!data_.is_array()) return;

    const std::string want = title_key(r.title);
    for (const auto& e : data_) {
        if (!e.is_object()) continue;
        auto t = e.find("title");
        if (t != e.end() && t->is_string() && title_key(t->get<std::string>()) == want) {
            throw DuplicateEntryError(path_.string() + " already contains " + r.title);
        }
    }
    for (const auto& e : data_) {
        if (!e.is_object()) continue;
        auto u = e.find("url");
        if (u != e.end() && u->is_string() && u->get<std::string>() == r.url) {
            throw DuplicateEntryError(path_.string() + " already contains " + r.url);
        }
    }
}

void ActivitiesFile::append(const PositionRecord& r) {
    json j = record_to_json(r);
    auto errors = validate_entry(j, r.title.empty() ? "Entry" : r.title);
    if (!errors.empty()) throw InvalidEntryError(std::move(errors));

    if (!data_.is_array()) data_ = json::array();
    data_.push_back(std::move(j));
}

void ActivitiesFile::save() const {
    try {
        write_json_file(path_, data_);
    } catch (const std::exception& e) {
        throw std::runtime_error("Can't write " + path_.string() + ": " + e.what());
    }
}

std::vector<PositionRecord> ActivitiesFile::records() const {
    if (!data_.is_array()) throw std::runtime_error(path_.string() + ": top-level data structure is not a list");

    std::vector<PositionRecord> out;
    out.reserve(data_.size());
    for (size_t i = 0; i < data_.size(); ++i) {
        std::ostringstream where;
        where << "root[" << i << "]";
        out.push_back(record_from_json(data_[i], where.str()));
    }
    return out;
}

std::optional<PositionRecord> ActivitiesFile::find_by_title(const std::string& title) const {
    const std::string want = title_key(title);
    for (const auto& r : records()) {
        if (title_key(r.title) == want) return r;
    }
    return std::nullopt;
}

}  // namespace positions
