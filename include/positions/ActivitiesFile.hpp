#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "positions/Models.hpp"
#include "positions/Validator.hpp"

namespace positions {

class DuplicateEntryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidEntryError : public std::runtime_error {
public:
    explicit InvalidEntryError(std::vector<ValidationError> errors);
    const std::vector<ValidationError>& errors() const { return errors_; }

private:
    std::vector<ValidationError> errors_;
};

// activities.json: the list of standards efforts and Mozilla's position on each.
class ActivitiesFile {
public:
    explicit ActivitiesFile(std::filesystem::path path);

    // throws std::runtime_error("Can't load <path>: ...")
    static ActivitiesFile load(const std::filesystem::path& path);

    const std::filesystem::path& path() const { return path_; }
    const nlohmann::json& data() const { return data_; }
    size_t size() const { return data_.is_array() ? data_.size() : 0; }

    ValidationReport validate() const;

    // throws DuplicateEntryError if the title (case/space-insensitive) or url is taken
    void check_unique(const PositionRecord& r) const;

    // throws InvalidEntryError if the record does not validate
    void append(const PositionRecord& r);

    void save() const;

    // typed view; throws if the document is not a valid list of records
    std::vector<PositionRecord> records() const;
    std::optional<PositionRecord> find_by_title(const std::string& title) const;

private:
    std::filesystem::path path_;
    nlohmann::json data_ = nlohmann::json::array();
};

}  // namespace positions
