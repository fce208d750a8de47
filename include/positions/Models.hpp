#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace positions {

struct PositionRecord {
    std::string title;                              // required
    std::string description;                        // required
    std::string org;                                // W3C, WHATWG, IETF, Ecma, Other
    std::string url;                                // canonical spec URL
    std::string moz_position = "under consideration";

    std::optional<std::string> ciu_name;            // caniuse.com feature id
    std::optional<std::string> group;               // working group
    std::optional<std::string> moz_bug_url;
    std::optional<std::int64_t> moz_position_issue; // standards-positions issue number
    std::optional<std::string> moz_position_detail;
};

enum class FieldKind {
    String,
    Url,
    Integer,
    Enum
};

struct FieldSpec {
    const char* name;
    bool required;
    FieldKind kind;
    std::vector<std::string> choices; // only for Enum
};

// Schema of a record in activities.json, in the order members are checked.
const std::vector<FieldSpec>& field_specs();

const std::vector<std::string>& known_positions();
const std::vector<std::string>& known_orgs();

bool is_known_field(const std::string& name);

}  // namespace positions
